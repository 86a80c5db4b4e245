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

#ifndef TRACETREE_TRACE_JSONLOG_JSONLOG_TRACING_H_
#define TRACETREE_TRACE_JSONLOG_JSONLOG_TRACING_H_

#include <memory>
#include <string>

#include "trace/jsonlog/jsonlog_span.h"
#include "trace/jsonlog/jsonlog_writer.h"
#include "trace/tracing.h"

namespace tracetree {

// Writes spans to a trace log file as they close. When path is an existing
// directory the log is created in it, named after the root id.
// The root is created at construction and logged on Exit(), so the tree can
// only be read back after the tracing has exited.
class JsonLogTracing : public Tracing {
 public:
  explicit JsonLogTracing(const std::string& path);
  JsonLogTracing(const std::string& path, const std::string& root_name);

  SpanSPtr RootSpan() const override { return root_; }

  Status GetTree(TreeSPtr* tree) const override;

  const std::string& LogPath() const { return writer_->Path(); }

 protected:
  Status OnEnter() override { return writer_->Open(); }

 private:
  JsonLogWriterSPtr writer_;
  std::shared_ptr<JsonLogSpan> root_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_JSONLOG_JSONLOG_TRACING_H_
