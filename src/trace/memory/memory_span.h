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

#ifndef TRACETREE_TRACE_MEMORY_MEMORY_SPAN_H_
#define TRACETREE_TRACE_MEMORY_MEMORY_SPAN_H_

#include <json/json.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "trace/span.h"

namespace tracetree {

class MemorySpan;
using MemorySpanSPtr = std::shared_ptr<MemorySpan>;

// Span kept in process memory. A span owns its children, and is both the
// write handle and the tree node.
class MemorySpan : public Span,
                   public Tree,
                   public std::enable_shared_from_this<MemorySpan> {
 public:
  MemorySpan(const SpanId& id, const std::string& name, const Json::Value& data,
             std::optional<SpanId> parent_id,
             std::weak_ptr<MemorySpan> parent);

  static MemorySpanSPtr NewRoot(const std::string& name,
                                const Json::Value& data);

  // A detached copy of a span living in another process, with the same id
  // and the data it had when the reference was taken.
  static Status FromReference(const SpanRef& ref, MemorySpanSPtr* span);

  const SpanId& Id() const override { return id_; }

  Status Name(std::string* name) const override;

  Status Data(Json::Value* data) const override;

  Status NewChild(const std::string& name, const Json::Value& data,
                  SpanSPtr* child) override;

  Status UpdateData(const Json::Value& patch) override;

  SpanRef Reference() const override;

  std::string Backend() const override { return "memory"; }

  Status Children(std::vector<TreeSPtr>* children) const override;

  Status Parent(TreeSPtr* parent) const override;

  std::vector<MemorySpanSPtr> ChildSpans() const;

 private:
  const SpanId id_;
  const std::string name_;
  const std::optional<SpanId> parent_id_;
  const std::weak_ptr<MemorySpan> parent_;

  mutable std::mutex mutex_;
  Json::Value data_;
  std::vector<MemorySpanSPtr> children_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_MEMORY_MEMORY_SPAN_H_
