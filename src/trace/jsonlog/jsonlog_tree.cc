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

#include "trace/jsonlog/jsonlog_tree.h"

#include <algorithm>
#include <fstream>
#include <map>

#include "fmt/format.h"
#include "trace/jsonlog/jsonlog_span.h"
#include "utils/json_util.h"
#include "utils/merge_patch.h"

namespace tracetree {

struct LoggedSpan {
  std::string name;
  Json::Value data;
  std::optional<SpanId> parent_id;
};

static Status ParseLine(const std::string& line, SpanId* id,
                        LoggedSpan* span) {
  Json::Value value;
  TRACETREE_RETURN_NOT_OK(utils::StringToJsonObject(line, &value));

  if (!value[kJsonLogIdKey].isString() || !value[kJsonLogNameKey].isString()) {
    return Status::InvalidParam("missing id or name");
  }
  TRACETREE_RETURN_NOT_OK(
      SpanId::FromString(value[kJsonLogIdKey].asString(), id));

  span->name = value[kJsonLogNameKey].asString();
  span->data = value[kJsonLogDataKey].isObject()
                   ? value[kJsonLogDataKey]
                   : Json::Value(Json::objectValue);

  const Json::Value& parent = value[kJsonLogParentIdKey];
  if (parent.isString()) {
    SpanId parent_id;
    TRACETREE_RETURN_NOT_OK(SpanId::FromString(parent.asString(), &parent_id));
    span->parent_id = parent_id;
  } else if (!parent.isNull()) {
    return Status::InvalidParam("parent_id is neither string nor null");
  }

  return Status::OK();
}

Status ParseLoggedTree(const std::string& path, JsonLogTreeSPtr* root) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Status::NotFound("open trace log fail", path);
  }

  std::map<SpanId, LoggedSpan> spans;
  std::string line;
  size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    if (line.empty()) continue;

    SpanId id;
    LoggedSpan span;
    Status s = ParseLine(line, &id, &span);
    if (!s.ok()) {
      return Status::InvalidParam(
          fmt::format("bad trace log line {} in {}", line_no, path),
          s.ToString());
    }

    auto it = spans.find(id);
    if (it == spans.end()) {
      spans.emplace(id, std::move(span));
    } else {
      ApplyMergePatch(&it->second.data, span.data);
    }
  }

  if (spans.empty()) {
    return Status::InvalidParam("no span found in trace log", path);
  }

  // std::map iterates in id order, which is creation order
  std::map<SpanId, JsonLogTreeSPtr> nodes;
  std::vector<JsonLogTreeSPtr> roots;
  for (const auto& [id, span] : spans) {
    auto node =
        std::make_shared<JsonLogTree>(id, span.name, span.data, span.parent_id);
    nodes.emplace(id, node);
    if (!span.parent_id.has_value()) roots.push_back(node);
  }

  if (roots.size() != 1) {
    return Status::InvalidParam(
        fmt::format("expect exactly one root, found {}", roots.size()), path);
  }

  for (const auto& [id, node] : nodes) {
    if (!node->parent_id_.has_value()) continue;

    auto it = nodes.find(*node->parent_id_);
    if (it == nodes.end()) {
      return Status::InvalidParam(
          fmt::format("parent of span {} not in trace log", id.ToString()),
          path);
    }
    node->parent_ = it->second;
    it->second->children_.push_back(node);
  }

  *root = roots.front();
  return Status::OK();
}

}  // namespace tracetree
