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

#include "trace/remote/span_codec.h"

#include "utils/json_util.h"

namespace tracetree {
namespace remote {

Json::Value RecordToJson(const SpanRecord& record) {
  Json::Value json(Json::objectValue);
  json[kNameField] = record.name;
  json[kDataJsonField] = record.data_json;
  json[kParentIdField] = record.parent_id.has_value()
                             ? Json::Value(record.parent_id->ToString())
                             : Json::Value(Json::nullValue);
  return json;
}

Status RecordFromJson(const Json::Value& json, const SpanId& id,
                      SpanRecord* record) {
  if (!json.isObject()) {
    return Status::InvalidParam("span body is not an object");
  }
  if (!json[kNameField].isString() || !json[kDataJsonField].isString()) {
    return Status::InvalidParam("span body needs name and data_json");
  }

  // data_json must hold an object
  Json::Value data;
  TRACETREE_RETURN_NOT_OK(
      utils::StringToJsonObject(json[kDataJsonField].asString(), &data));

  record->id = id;
  record->name = json[kNameField].asString();
  record->data_json = json[kDataJsonField].asString();

  const Json::Value& parent = json[kParentIdField];
  if (parent.isNull()) {
    record->parent_id = std::nullopt;
  } else if (parent.isString()) {
    SpanId parent_id;
    TRACETREE_RETURN_NOT_OK(SpanId::FromString(parent.asString(), &parent_id));
    record->parent_id = parent_id;
  } else {
    return Status::InvalidParam("parent_id is neither string nor null");
  }

  return Status::OK();
}

Json::Value IdsToJson(const std::vector<SpanId>& ids) {
  Json::Value json(Json::arrayValue);
  for (const auto& id : ids) {
    json.append(id.ToString());
  }
  return json;
}

Status IdsFromJson(const Json::Value& json, std::vector<SpanId>* ids) {
  if (!json.isArray()) {
    return Status::InvalidParam("id list is not an array");
  }

  ids->clear();
  for (const auto& item : json) {
    if (!item.isString()) {
      return Status::InvalidParam("id is not a string");
    }
    SpanId id;
    TRACETREE_RETURN_NOT_OK(SpanId::FromString(item.asString(), &id));
    ids->push_back(id);
  }
  return Status::OK();
}

}  // namespace remote
}  // namespace tracetree
