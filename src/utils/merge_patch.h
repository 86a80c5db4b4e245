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

#ifndef TRACETREE_UTILS_MERGE_PATCH_H_
#define TRACETREE_UTILS_MERGE_PATCH_H_

#include <json/json.h>

namespace tracetree {

// JSON Merge Patch, RFC 7396.
//  - an object patch is merged member by member into the target, a null
//    member removes the key, any other member is merged recursively;
//  - a non object target is treated as {} before merging an object patch;
//  - a non object patch (null included) replaces the target.
Json::Value MergePatch(const Json::Value& target, const Json::Value& patch);

// Same as MergePatch(), but modifies target in place.
void ApplyMergePatch(Json::Value* target, const Json::Value& patch);

}  // namespace tracetree

#endif  // TRACETREE_UTILS_MERGE_PATCH_H_
