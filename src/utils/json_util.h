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

#ifndef TRACETREE_UTILS_JSON_UTIL_H_
#define TRACETREE_UTILS_JSON_UTIL_H_

#include <json/json.h>

#include <string>
#include <string_view>

#include "common/status.h"

namespace tracetree {
namespace utils {

// Serialize to a single line.
std::string JsonToString(const Json::Value& value);

Status StringToJson(std::string_view str, Json::Value* value);

// Like StringToJson(), but the result must be an object.
Status StringToJsonObject(std::string_view str, Json::Value* value);

}  // namespace utils
}  // namespace tracetree

#endif  // TRACETREE_UTILS_JSON_UTIL_H_
