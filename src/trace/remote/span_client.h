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

#ifndef TRACETREE_TRACE_REMOTE_SPAN_CLIENT_H_
#define TRACETREE_TRACE_REMOTE_SPAN_CLIENT_H_

#include <brpc/channel.h>
#include <brpc/http_method.h>
#include <json/json.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/status.h"
#include "trace/sqlite/span_db.h"

namespace tracetree {
namespace remote {

// Blocking http client of a span server. Only WaitForReady() retries.
// http 404/409/400 come back as NotFound/Exist/InvalidParam, transport
// failures as NetError.
class SpanClient {
 public:
  // e.g. "http://127.0.0.1:8000"
  explicit SpanClient(const std::string& server_url);

  Status Init();

  const std::string& Url() const { return server_url_; }

  Status IsReady();

  // Poll IsReady() until it succeeds, Timeout after timeout_ms.
  Status WaitForReady(int64_t timeout_ms, int64_t poll_interval_ms);

  Status PutSpan(const SpanRecord& record);

  Status PatchSpan(const SpanId& id, const std::string& patch_json);

  Status GetSpan(const SpanId& id, SpanRecord* record);

  Status GetChildrenIds(const SpanId& id, std::vector<SpanId>* ids);

  Status GetRootIds(std::vector<SpanId>* ids);

  Status GetLastUpdated(SpanId* id, double* last_updated);

  // Nested json of the newest trace, {} when the server holds no span.
  Status GetTree(Json::Value* tree);

 private:
  Status Call(brpc::HttpMethod method, const std::string& path,
              const std::string& body, Json::Value* response);

  const std::string server_url_;
  brpc::Channel channel_;
};

using SpanClientSPtr = std::shared_ptr<SpanClient>;

}  // namespace remote
}  // namespace tracetree

#endif  // TRACETREE_TRACE_REMOTE_SPAN_CLIENT_H_
