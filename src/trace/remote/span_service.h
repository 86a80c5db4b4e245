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

#ifndef TRACETREE_TRACE_REMOTE_SPAN_SERVICE_H_
#define TRACETREE_TRACE_REMOTE_SPAN_SERVICE_H_

#include <brpc/server.h>

#include "common/status.h"
#include "trace/sqlite/span_db.h"
#include "tracetree/span_service.pb.h"

namespace tracetree {
namespace remote {

using PBSpanService = pb::remote::SpanService;
using PBHttpRequest = pb::remote::HttpRequest;
using PBHttpResponse = pb::remote::HttpResponse;

// Http front of a SpanDatabase.
class SpanServiceImpl final : public PBSpanService {
 public:
  explicit SpanServiceImpl(SpanDatabaseSPtr db) : db_(std::move(db)) {}

  void Ready(google::protobuf::RpcController* controller,
             const PBHttpRequest* request, PBHttpResponse* response,
             google::protobuf::Closure* done) override;

  void HandleSpan(google::protobuf::RpcController* controller,
                  const PBHttpRequest* request, PBHttpResponse* response,
                  google::protobuf::Closure* done) override;

  void GetRoots(google::protobuf::RpcController* controller,
                const PBHttpRequest* request, PBHttpResponse* response,
                google::protobuf::Closure* done) override;

  void GetLastUpdated(google::protobuf::RpcController* controller,
                      const PBHttpRequest* request, PBHttpResponse* response,
                      google::protobuf::Closure* done) override;

  void GetTree(google::protobuf::RpcController* controller,
               const PBHttpRequest* request, PBHttpResponse* response,
               google::protobuf::Closure* done) override;

 private:
  void PutSpan(brpc::Controller* cntl, const SpanId& id);
  void PatchSpan(brpc::Controller* cntl, const SpanId& id);
  void GetSpan(brpc::Controller* cntl, const SpanId& id);
  void GetChildren(brpc::Controller* cntl, const SpanId& id);

  SpanDatabaseSPtr db_;
};

// Register the service with its restful mappings.
Status AddSpanService(brpc::Server* server, SpanServiceImpl* service);

}  // namespace remote
}  // namespace tracetree

#endif  // TRACETREE_TRACE_REMOTE_SPAN_SERVICE_H_
