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

#ifndef TRACETREE_TRACE_SPAN_REF_H_
#define TRACETREE_TRACE_SPAN_REF_H_

#include <json/json.h>

#include <cstdint>
#include <memory>
#include <string>

#include "common/status.h"
#include "utils/span_id.h"

namespace tracetree {

class Span;
using SpanSPtr = std::shared_ptr<Span>;

enum class BackendKind : uint8_t {
  kMemory = 0,
  kJsonLog = 1,
  kSqlite = 2,
  kRemote = 3,
};

std::string BackendKindName(BackendKind kind);

Status ParseBackendKind(const std::string& name, BackendKind* kind);

// A serializable reference to a span, the only thing about a span that
// crosses a process boundary. The receiving process turns it back into a live
// handle with ResolveSpan().
struct SpanRef {
  BackendKind kind{BackendKind::kMemory};
  SpanId id;
  // sqlite: database path, remote: server url, jsonlog: log file path
  std::string locator;
  // {name, parent_id, data} of the span when the reference was taken, only
  // set by backends that can not re-read a span from their store.
  Json::Value snapshot;

  Json::Value ToJson() const;
  static Status FromJson(const Json::Value& value, SpanRef* ref);

  std::string ToString() const;
  static Status FromString(const std::string& str, SpanRef* ref);
};

// Build a live span handle from a reference taken in another process.
Status ResolveSpan(const SpanRef& ref, SpanSPtr* span);

}  // namespace tracetree

#endif  // TRACETREE_TRACE_SPAN_REF_H_
