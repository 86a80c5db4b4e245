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

#ifndef TRACETREE_TRACE_REMOTE_SPAN_CODEC_H_
#define TRACETREE_TRACE_REMOTE_SPAN_CODEC_H_

#include <json/json.h>

#include <vector>

#include "common/status.h"
#include "trace/sqlite/span_db.h"

namespace tracetree {
namespace remote {

inline constexpr char kReadyPath[] = "/api/status/ready";
inline constexpr char kSpanPath[] = "/api/span/";
inline constexpr char kChildrenSuffix[] = "children";
inline constexpr char kRootPath[] = "/api/tracing/root";
inline constexpr char kLastUpdatedPath[] = "/api/tracing/last_updated";
inline constexpr char kTreePath[] = "/api/tracing/tree";

inline constexpr char kNameField[] = "name";
inline constexpr char kDataJsonField[] = "data_json";
inline constexpr char kParentIdField[] = "parent_id";
inline constexpr char kIdField[] = "id";
inline constexpr char kLastUpdatedField[] = "last_updated";

// {name, data_json, parent_id}, the id travels in the path.
Json::Value RecordToJson(const SpanRecord& record);
Status RecordFromJson(const Json::Value& json, const SpanId& id,
                      SpanRecord* record);

Json::Value IdsToJson(const std::vector<SpanId>& ids);
Status IdsFromJson(const Json::Value& json, std::vector<SpanId>* ids);

}  // namespace remote
}  // namespace tracetree

#endif  // TRACETREE_TRACE_REMOTE_SPAN_CODEC_H_
