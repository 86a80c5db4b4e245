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

#include "trace/jsonlog/jsonlog_tracing.h"

#include <filesystem>

#include "common/options/trace.h"
#include "fmt/format.h"
#include "trace/jsonlog/jsonlog_tree.h"

namespace tracetree {

static std::string PrepareLogPath(const std::string& path, const SpanId& id) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return (std::filesystem::path(path) / fmt::format("{}.log", id.ToString()))
        .string();
  }
  return path;
}

JsonLogTracing::JsonLogTracing(const std::string& path)
    : JsonLogTracing(path, FLAGS_trace_root_name) {}

JsonLogTracing::JsonLogTracing(const std::string& path,
                               const std::string& root_name) {
  SpanId root_id = NewSpanId();
  writer_ = std::make_shared<JsonLogWriter>(PrepareLogPath(path, root_id));
  root_ = std::make_shared<JsonLogSpan>(writer_, root_id, root_name,
                                        Json::Value(Json::objectValue),
                                        std::nullopt, false);
}

Status JsonLogTracing::GetTree(TreeSPtr* tree) const {
  JsonLogTreeSPtr root;
  TRACETREE_RETURN_NOT_OK(ParseLoggedTree(writer_->Path(), &root));
  *tree = root;
  return Status::OK();
}

}  // namespace tracetree
