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

#ifndef TRACETREE_TRACE_TREE_JSON_H_
#define TRACETREE_TRACE_TREE_JSON_H_

#include <json/json.h>

#include "common/status.h"
#include "trace/span.h"

namespace tracetree {

// Export a tree as nested json: {"name", "data", "children": [...]}.
Status TreeToJson(const Tree& tree, Json::Value* json);

// Number of nodes in the tree, root included.
Status CountTreeNodes(const Tree& tree, size_t* count);

}  // namespace tracetree

#endif  // TRACETREE_TRACE_TREE_JSON_H_
