/*
 * Copyright (c) 2025 dingodb.com, Inc. All Rights Reserved
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef TRACETREE_TRACE_MEMORY_MEMORY_TRACING_H_
#define TRACETREE_TRACE_MEMORY_MEMORY_TRACING_H_

#include "trace/memory/memory_span.h"
#include "trace/tracing.h"

namespace tracetree {

// Keeps the whole tree in memory, the root is created at construction.
class MemoryTracing : public Tracing {
 public:
  MemoryTracing();
  explicit MemoryTracing(const std::string& root_name);

  ~MemoryTracing() override = default;

  SpanSPtr RootSpan() const override { return root_; }

  Status GetTree(TreeSPtr* tree) const override {
    *tree = root_;
    return Status::OK();
  }

  const MemorySpanSPtr& Root() const { return root_; }

 private:
  MemorySpanSPtr root_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_MEMORY_MEMORY_TRACING_H_
