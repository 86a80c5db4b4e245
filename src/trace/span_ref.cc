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

#include "trace/span_ref.h"

#include "trace/jsonlog/jsonlog_span.h"
#include "trace/memory/memory_span.h"
#include "trace/remote/remote_span.h"
#include "trace/sqlite/sqlite_span.h"
#include "utils/json_util.h"

namespace tracetree {

static constexpr char kKindKey[] = "kind";
static constexpr char kIdKey[] = "id";
static constexpr char kLocatorKey[] = "locator";
static constexpr char kSnapshotKey[] = "snapshot";

std::string BackendKindName(BackendKind kind) {
  switch (kind) {
    case BackendKind::kMemory:
      return "memory";
    case BackendKind::kJsonLog:
      return "jsonlog";
    case BackendKind::kSqlite:
      return "sqlite";
    case BackendKind::kRemote:
      return "remote";
  }
  return "unknown";
}

Status ParseBackendKind(const std::string& name, BackendKind* kind) {
  for (auto candidate : {BackendKind::kMemory, BackendKind::kJsonLog,
                         BackendKind::kSqlite, BackendKind::kRemote}) {
    if (BackendKindName(candidate) == name) {
      *kind = candidate;
      return Status::OK();
    }
  }
  return Status::InvalidParam("unknown backend kind", name);
}

Json::Value SpanRef::ToJson() const {
  Json::Value json(Json::objectValue);
  json[kKindKey] = BackendKindName(kind);
  json[kIdKey] = id.ToString();
  json[kLocatorKey] = locator;
  if (!snapshot.isNull()) {
    json[kSnapshotKey] = snapshot;
  }
  return json;
}

Status SpanRef::FromJson(const Json::Value& value, SpanRef* ref) {
  if (!value.isObject() || !value[kKindKey].isString() ||
      !value[kIdKey].isString()) {
    return Status::InvalidParam("span reference needs kind and id");
  }

  SpanRef parsed;
  TRACETREE_RETURN_NOT_OK(
      ParseBackendKind(value[kKindKey].asString(), &parsed.kind));
  TRACETREE_RETURN_NOT_OK(SpanId::FromString(value[kIdKey].asString(),
                                             &parsed.id));
  parsed.locator = value.get(kLocatorKey, "").asString();
  parsed.snapshot = value[kSnapshotKey];

  *ref = std::move(parsed);
  return Status::OK();
}

std::string SpanRef::ToString() const { return utils::JsonToString(ToJson()); }

Status SpanRef::FromString(const std::string& str, SpanRef* ref) {
  Json::Value value;
  TRACETREE_RETURN_NOT_OK(utils::StringToJsonObject(str, &value));
  return FromJson(value, ref);
}

Status ResolveSpan(const SpanRef& ref, SpanSPtr* span) {
  switch (ref.kind) {
    case BackendKind::kMemory: {
      MemorySpanSPtr memory_span;
      TRACETREE_RETURN_NOT_OK(MemorySpan::FromReference(ref, &memory_span));
      *span = memory_span;
      return Status::OK();
    }
    case BackendKind::kJsonLog:
      return JsonLogSpan::FromReference(ref, span);
    case BackendKind::kSqlite:
      return SqliteSpan::FromReference(ref, span);
    case BackendKind::kRemote:
      return RemoteSpan::FromReference(ref, span);
  }
  return Status::InvalidParam("unknown backend kind");
}

}  // namespace tracetree
