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

#include "trace/remote/span_service.h"

#include <absl/strings/str_split.h>
#include <brpc/closure_guard.h>
#include <brpc/controller.h>

#include <string>
#include <vector>

#include "common/logging.h"
#include "fmt/format.h"
#include "trace/remote/span_codec.h"
#include "trace/sqlite/sqlite_span.h"
#include "trace/tree_json.h"
#include "utils/json_util.h"

namespace tracetree {
namespace remote {

static int ToHttpCode(const Status& status) {
  if (status.IsNotFound()) return brpc::HTTP_STATUS_NOT_FOUND;
  if (status.IsExist()) return brpc::HTTP_STATUS_CONFLICT;
  if (status.IsInvalidParam()) return brpc::HTTP_STATUS_BAD_REQUEST;
  return brpc::HTTP_STATUS_INTERNAL_SERVER_ERROR;
}

static void ReplyJson(brpc::Controller* cntl, const Json::Value& body) {
  cntl->http_response().set_content_type("application/json");

  butil::IOBufBuilder os;
  os << utils::JsonToString(body);
  os.move_to(cntl->response_attachment());
}

static void ReplyError(brpc::Controller* cntl, const Status& status) {
  int code = ToHttpCode(status);
  LOG_IF(ERROR, code == brpc::HTTP_STATUS_INTERNAL_SERVER_ERROR)
      << "span request fail, path: " << cntl->http_request().uri().path()
      << ", status: " << status.ToString();

  cntl->http_response().set_status_code(code);
  cntl->http_response().set_content_type("text/plain");
  cntl->response_attachment().append(status.ToString());
}

static Status ParseBody(brpc::Controller* cntl, Json::Value* body) {
  return utils::StringToJsonObject(cntl->request_attachment().to_string(),
                                   body);
}

void SpanServiceImpl::Ready(google::protobuf::RpcController* controller,
                            const PBHttpRequest* /*request*/,
                            PBHttpResponse* /*response*/,
                            google::protobuf::Closure* done) {
  brpc::ClosureGuard done_guard(done);
  auto* cntl = static_cast<brpc::Controller*>(controller);

  ReplyJson(cntl, Json::Value("ok"));
}

void SpanServiceImpl::HandleSpan(google::protobuf::RpcController* controller,
                                 const PBHttpRequest* /*request*/,
                                 PBHttpResponse* /*response*/,
                                 google::protobuf::Closure* done) {
  brpc::ClosureGuard done_guard(done);
  auto* cntl = static_cast<brpc::Controller*>(controller);

  // "<id>" or "<id>/children"
  std::vector<std::string> parts = absl::StrSplit(
      cntl->http_request().unresolved_path(), '/', absl::SkipEmpty());
  if (parts.empty() || parts.size() > 2 ||
      (parts.size() == 2 && parts[1] != kChildrenSuffix)) {
    ReplyError(cntl, Status::NotFound("unknown span path",
                                      cntl->http_request().unresolved_path()));
    return;
  }

  SpanId id;
  Status s = SpanId::FromString(parts[0], &id);
  if (!s.ok()) {
    ReplyError(cntl, s);
    return;
  }

  auto method = cntl->http_request().method();
  if (parts.size() == 2) {
    if (method != brpc::HTTP_METHOD_GET) {
      cntl->http_response().set_status_code(
          brpc::HTTP_STATUS_METHOD_NOT_ALLOWED);
      return;
    }
    GetChildren(cntl, id);
    return;
  }

  switch (method) {
    case brpc::HTTP_METHOD_PUT:
      PutSpan(cntl, id);
      break;
    case brpc::HTTP_METHOD_PATCH:
      PatchSpan(cntl, id);
      break;
    case brpc::HTTP_METHOD_GET:
      GetSpan(cntl, id);
      break;
    default:
      cntl->http_response().set_status_code(
          brpc::HTTP_STATUS_METHOD_NOT_ALLOWED);
      break;
  }
}

void SpanServiceImpl::PutSpan(brpc::Controller* cntl, const SpanId& id) {
  Json::Value body;
  SpanRecord record;
  Status s = ParseBody(cntl, &body);
  if (s.ok()) s = RecordFromJson(body, id, &record);
  if (s.ok()) s = db_->Insert(record);

  if (!s.ok()) {
    ReplyError(cntl, s);
    return;
  }

  LOG_DEBUG << "put span " << id.ToString() << ", name: " << record.name;
  ReplyJson(cntl, Json::Value(Json::objectValue));
}

void SpanServiceImpl::PatchSpan(brpc::Controller* cntl, const SpanId& id) {
  Json::Value body;
  Json::Value patch;
  Status s = ParseBody(cntl, &body);
  if (s.ok() && !body[kDataJsonField].isString()) {
    s = Status::InvalidParam("patch body needs data_json");
  }
  if (s.ok()) {
    s = utils::StringToJsonObject(body[kDataJsonField].asString(), &patch);
  }
  if (s.ok()) s = db_->UpdateDataJson(id, body[kDataJsonField].asString());

  if (!s.ok()) {
    ReplyError(cntl, s);
    return;
  }

  ReplyJson(cntl, Json::Value(Json::objectValue));
}

void SpanServiceImpl::GetSpan(brpc::Controller* cntl, const SpanId& id) {
  SpanRecord record;
  Status s = db_->GetSpan(id, &record);
  if (!s.ok()) {
    ReplyError(cntl, s);
    return;
  }

  ReplyJson(cntl, RecordToJson(record));
}

void SpanServiceImpl::GetChildren(brpc::Controller* cntl, const SpanId& id) {
  std::vector<SpanId> ids;
  Status s = db_->GetChildrenIds(id, &ids);
  if (!s.ok()) {
    ReplyError(cntl, s);
    return;
  }

  ReplyJson(cntl, IdsToJson(ids));
}

void SpanServiceImpl::GetRoots(google::protobuf::RpcController* controller,
                               const PBHttpRequest* /*request*/,
                               PBHttpResponse* /*response*/,
                               google::protobuf::Closure* done) {
  brpc::ClosureGuard done_guard(done);
  auto* cntl = static_cast<brpc::Controller*>(controller);

  std::vector<SpanId> ids;
  Status s = db_->GetRootIds(&ids);
  if (!s.ok()) {
    ReplyError(cntl, s);
    return;
  }

  ReplyJson(cntl, IdsToJson(ids));
}

void SpanServiceImpl::GetLastUpdated(
    google::protobuf::RpcController* controller,
    const PBHttpRequest* /*request*/, PBHttpResponse* /*response*/,
    google::protobuf::Closure* done) {
  brpc::ClosureGuard done_guard(done);
  auto* cntl = static_cast<brpc::Controller*>(controller);

  SpanId id;
  double last_updated = 0;
  Status s = db_->GetLastUpdatedSpanId(&id, &last_updated);
  if (!s.ok()) {
    ReplyError(cntl, s);
    return;
  }

  Json::Value body(Json::objectValue);
  body[kIdField] = id.ToString();
  body[kLastUpdatedField] = last_updated;
  ReplyJson(cntl, body);
}

void SpanServiceImpl::GetTree(google::protobuf::RpcController* controller,
                              const PBHttpRequest* /*request*/,
                              PBHttpResponse* /*response*/,
                              google::protobuf::Closure* done) {
  brpc::ClosureGuard done_guard(done);
  auto* cntl = static_cast<brpc::Controller*>(controller);

  std::vector<SpanId> roots;
  Status s = db_->GetRootIds(&roots);
  if (!s.ok()) {
    ReplyError(cntl, s);
    return;
  }

  if (roots.empty()) {
    ReplyJson(cntl, Json::Value(Json::objectValue));
    return;
  }

  // ids are ordered by creation, the last root is the newest trace
  Json::Value tree;
  s = TreeToJson(SqliteTree(db_, roots.back()), &tree);
  if (!s.ok()) {
    ReplyError(cntl, s);
    return;
  }

  ReplyJson(cntl, tree);
}

Status AddSpanService(brpc::Server* server, SpanServiceImpl* service) {
  std::string mappings = fmt::format(
      "{} => Ready,"
      "{}* => HandleSpan,"
      "{} => GetRoots,"
      "{} => GetLastUpdated,"
      "{} => GetTree",
      kReadyPath, kSpanPath, kRootPath, kLastUpdatedPath, kTreePath);

  int rc =
      server->AddService(service, brpc::SERVER_DOESNT_OWN_SERVICE, mappings);
  if (rc != 0) {
    LOG(ERROR) << "Add span service to server failed: rc = " << rc;
    return Status::Internal("add span service failed");
  }
  return Status::OK();
}

}  // namespace remote
}  // namespace tracetree
