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

#include "utils/merge_patch.h"

namespace tracetree {

void ApplyMergePatch(Json::Value* target, const Json::Value& patch) {
  if (!patch.isObject()) {
    *target = patch;
    return;
  }

  if (!target->isObject()) {
    *target = Json::Value(Json::objectValue);
  }

  for (const auto& name : patch.getMemberNames()) {
    const Json::Value& value = patch[name];
    if (value.isNull()) {
      target->removeMember(name);
    } else {
      ApplyMergePatch(&(*target)[name], value);
    }
  }
}

Json::Value MergePatch(const Json::Value& target, const Json::Value& patch) {
  Json::Value result = target;
  ApplyMergePatch(&result, patch);
  return result;
}

}  // namespace tracetree
