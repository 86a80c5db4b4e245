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

#ifndef TRACETREE_TRACE_JSONLOG_JSONLOG_SPAN_H_
#define TRACETREE_TRACE_JSONLOG_JSONLOG_SPAN_H_

#include <json/json.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "trace/jsonlog/jsonlog_writer.h"
#include "trace/span.h"

namespace tracetree {

// Line keys of the trace log.
inline constexpr char kJsonLogIdKey[] = "id";
inline constexpr char kJsonLogNameKey[] = "name";
inline constexpr char kJsonLogParentIdKey[] = "parent_id";
inline constexpr char kJsonLogDataKey[] = "data";

// Span written to a trace log as one json line when it is closed, and again
// for every update made after that.
class JsonLogSpan : public Span,
                    public std::enable_shared_from_this<JsonLogSpan> {
 public:
  JsonLogSpan(JsonLogWriterSPtr writer, const SpanId& id,
              const std::string& name, const Json::Value& data,
              std::optional<SpanId> parent_id, bool closed);

  // A span taken from another process, already closed there, so every
  // update is logged right away.
  static Status FromReference(const SpanRef& ref, SpanSPtr* span);

  const SpanId& Id() const override { return id_; }

  Status Name(std::string* name) const override;

  Status Data(Json::Value* data) const override;

  Status NewChild(const std::string& name, const Json::Value& data,
                  SpanSPtr* child) override;

  Status UpdateData(const Json::Value& patch) override;

  void Close() override;

  SpanRef Reference() const override;

  std::string Backend() const override { return "jsonlog"; }

 private:
  Json::Value ToLine() const;

  const JsonLogWriterSPtr writer_;
  const SpanId id_;
  const std::string name_;
  const std::optional<SpanId> parent_id_;

  mutable std::mutex mutex_;
  Json::Value data_;
  bool closed_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_JSONLOG_JSONLOG_SPAN_H_
