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

#include "utils/json_util.h"

#include <memory>

#include "fmt/format.h"

namespace tracetree {
namespace utils {

std::string JsonToString(const Json::Value& value) {
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  writer["emitUTF8"] = true;
  return Json::writeString(writer, value);
}

Status StringToJson(std::string_view str, Json::Value* value) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  std::string err;
  if (!reader->parse(str.data(), str.data() + str.size(), value, &err)) {
    return Status::InvalidParam(fmt::format("parse json fail, error({})", err));
  }

  return Status::OK();
}

Status StringToJsonObject(std::string_view str, Json::Value* value) {
  TRACETREE_RETURN_NOT_OK(StringToJson(str, value));
  if (!value->isObject()) {
    return Status::InvalidParam("json is not an object", str);
  }

  return Status::OK();
}

}  // namespace utils
}  // namespace tracetree
