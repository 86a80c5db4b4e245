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

#include "trace/remote/span_client.h"

#include <absl/strings/str_format.h>
#include <brpc/controller.h>

#include <chrono>
#include <thread>

#include "common/logging.h"
#include "common/options/trace.h"
#include "trace/remote/span_codec.h"
#include "utils/json_util.h"
#include "utils/time.h"

namespace tracetree {
namespace remote {

static Status FromHttpCode(int code, const std::string& text) {
  switch (code) {
    case brpc::HTTP_STATUS_NOT_FOUND:
      return Status::NotFound(text);
    case brpc::HTTP_STATUS_CONFLICT:
      return Status::Exist(text);
    case brpc::HTTP_STATUS_BAD_REQUEST:
      return Status::InvalidParam(text);
    default:
      return Status::Internal(code, text);
  }
}

SpanClient::SpanClient(const std::string& server_url)
    : server_url_(server_url) {}

Status SpanClient::Init() {
  brpc::ChannelOptions options;
  options.protocol = brpc::PROTOCOL_HTTP;
  options.timeout_ms = FLAGS_trace_rpc_timeout_ms;
  options.max_retry = 0;

  int rc = channel_.Init(server_url_.c_str(), "", &options);
  if (rc != 0) {
    LOG(ERROR) << "Initialize channel failed: url = " << server_url_
               << ", rc = " << rc;
    return Status::Internal(
        absl::StrFormat("init channel (%s) failed", server_url_));
  }
  return Status::OK();
}

Status SpanClient::Call(brpc::HttpMethod method, const std::string& path,
                        const std::string& body, Json::Value* response) {
  brpc::Controller cntl;
  cntl.http_request().uri() = server_url_ + path;
  cntl.http_request().set_method(method);
  if (!body.empty()) {
    cntl.http_request().set_content_type("application/json");
    cntl.request_attachment().append(body);
  }

  channel_.CallMethod(nullptr, &cntl, nullptr, nullptr, nullptr);
  if (cntl.Failed()) {
    int code = cntl.http_response().status_code();
    if (code != 0 && code != brpc::HTTP_STATUS_OK) {
      return FromHttpCode(code, cntl.response_attachment().to_string());
    }
    LOG(ERROR) << "Send span request failed: url = " << server_url_ << path
               << ", error_text = " << cntl.ErrorText();
    return Status::NetError(cntl.ErrorCode(), cntl.ErrorText());
  }

  if (response == nullptr) {
    return Status::OK();
  }
  return utils::StringToJson(cntl.response_attachment().to_string(), response);
}

Status SpanClient::IsReady() {
  Json::Value response;
  TRACETREE_RETURN_NOT_OK(
      Call(brpc::HTTP_METHOD_GET, kReadyPath, "", &response));
  if (!response.isString() || response.asString() != "ok") {
    return Status::Internal("unexpected ready response");
  }
  return Status::OK();
}

Status SpanClient::WaitForReady(int64_t timeout_ms, int64_t poll_interval_ms) {
  uint64_t deadline = utils::TimestampMs() + timeout_ms;
  Status s;
  while (true) {
    s = IsReady();
    if (s.ok()) {
      LOG(INFO) << "span server is ready: " << server_url_;
      return s;
    }

    if (utils::TimestampMs() >= deadline) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms));
  }

  return Status::Timeout(
      absl::StrFormat("span server %s not ready after %d ms", server_url_,
                      timeout_ms),
      s.ToString());
}

Status SpanClient::PutSpan(const SpanRecord& record) {
  return Call(brpc::HTTP_METHOD_PUT, kSpanPath + record.id.ToString(),
              utils::JsonToString(RecordToJson(record)), nullptr);
}

Status SpanClient::PatchSpan(const SpanId& id, const std::string& patch_json) {
  Json::Value body(Json::objectValue);
  body[kDataJsonField] = patch_json;
  return Call(brpc::HTTP_METHOD_PATCH, kSpanPath + id.ToString(),
              utils::JsonToString(body), nullptr);
}

Status SpanClient::GetSpan(const SpanId& id, SpanRecord* record) {
  Json::Value response;
  TRACETREE_RETURN_NOT_OK(
      Call(brpc::HTTP_METHOD_GET, kSpanPath + id.ToString(), "", &response));
  return RecordFromJson(response, id, record);
}

Status SpanClient::GetChildrenIds(const SpanId& id, std::vector<SpanId>* ids) {
  Json::Value response;
  TRACETREE_RETURN_NOT_OK(Call(
      brpc::HTTP_METHOD_GET,
      absl::StrFormat("%s%s/%s", kSpanPath, id.ToString(), kChildrenSuffix),
      "", &response));
  return IdsFromJson(response, ids);
}

Status SpanClient::GetRootIds(std::vector<SpanId>* ids) {
  Json::Value response;
  TRACETREE_RETURN_NOT_OK(
      Call(brpc::HTTP_METHOD_GET, kRootPath, "", &response));
  return IdsFromJson(response, ids);
}

Status SpanClient::GetLastUpdated(SpanId* id, double* last_updated) {
  Json::Value response;
  TRACETREE_RETURN_NOT_OK(
      Call(brpc::HTTP_METHOD_GET, kLastUpdatedPath, "", &response));
  if (!response[kIdField].isString() ||
      !response[kLastUpdatedField].isNumeric()) {
    return Status::Internal("unexpected last_updated response");
  }

  *last_updated = response[kLastUpdatedField].asDouble();
  return SpanId::FromString(response[kIdField].asString(), id);
}

Status SpanClient::GetTree(Json::Value* tree) {
  return Call(brpc::HTTP_METHOD_GET, kTreePath, "", tree);
}

}  // namespace remote
}  // namespace tracetree
