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

#include "trace/tree_json.h"

#include <string>
#include <vector>

#include "trace/constants.h"

namespace tracetree {

Status TreeToJson(const Tree& tree, Json::Value* json) {
  std::string name;
  TRACETREE_RETURN_NOT_OK(tree.Name(&name));

  Json::Value data;
  TRACETREE_RETURN_NOT_OK(tree.Data(&data));

  std::vector<TreeSPtr> children;
  TRACETREE_RETURN_NOT_OK(tree.Children(&children));

  Json::Value node(Json::objectValue);
  node[kNameKey] = name;
  node[kDataKey] = data;
  node[kChildrenKey] = Json::Value(Json::arrayValue);
  for (const auto& child : children) {
    Json::Value child_json;
    TRACETREE_RETURN_NOT_OK(TreeToJson(*child, &child_json));
    node[kChildrenKey].append(child_json);
  }

  *json = std::move(node);
  return Status::OK();
}

Status CountTreeNodes(const Tree& tree, size_t* count) {
  std::vector<TreeSPtr> children;
  TRACETREE_RETURN_NOT_OK(tree.Children(&children));

  size_t total = 1;
  for (const auto& child : children) {
    size_t sub = 0;
    TRACETREE_RETURN_NOT_OK(CountTreeNodes(*child, &sub));
    total += sub;
  }

  *count = total;
  return Status::OK();
}

}  // namespace tracetree
