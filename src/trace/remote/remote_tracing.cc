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

#include "trace/remote/remote_tracing.h"

#include "common/logging.h"
#include "common/options/trace.h"

namespace tracetree {

RemoteTracing::RemoteTracing(const RemoteTracingOption& option)
    : option_(option) {
  if (option_.root_name.empty()) {
    option_.root_name = FLAGS_trace_root_name;
  }
}

RemoteTracing::~RemoteTracing() {
  if (runner_ != nullptr) {
    Status s = runner_->Stop();
    LOG_IF(ERROR, !s.ok()) << "stop span server fail: " << s.ToString();
  }
}

std::string RemoteTracing::ServerUrl() const {
  return (client_ != nullptr) ? client_->Url() : std::string();
}

Status RemoteTracing::OnEnter() {
  std::string url = option_.server_url;
  if (url.empty()) {
    if (option_.db_path.empty()) {
      return Status::InvalidParam("remote tracing needs server_url or db_path");
    }

    runner_ = std::make_unique<remote::ServerProcessRunner>(
        FLAGS_trace_server_binary, option_.db_path);
    TRACETREE_RETURN_NOT_OK(runner_->Start());
    url = runner_->Url();
  }

  client_ = std::make_shared<remote::SpanClient>(url);
  Status s = client_->Init();
  if (s.ok()) s = CreateRoot();
  if (!s.ok()) {
    OnExit();
    return s;
  }

  return Status::OK();
}

Status RemoteTracing::CreateRoot() {
  if (option_.root_id.has_value()) {
    SpanRecord record;
    TRACETREE_RETURN_NOT_OK(client_->GetSpan(*option_.root_id, &record));
    if (record.parent_id.has_value()) {
      return Status::InvalidParam("span is not a root",
                                  option_.root_id->ToString());
    }
    root_ = std::make_shared<RemoteSpan>(client_, *option_.root_id);
    return Status::OK();
  }

  SpanRecord record;
  record.id = NewSpanId();
  record.name = option_.root_name;
  record.data_json = "{}";
  TRACETREE_RETURN_NOT_OK(client_->PutSpan(record));

  LOG(INFO) << "create root span " << record.id.ToString()
            << " on: " << client_->Url();

  root_ = std::make_shared<RemoteSpan>(client_, record.id);
  return Status::OK();
}

void RemoteTracing::OnExit() {
  if (runner_ != nullptr) {
    Status s = runner_->Stop();
    LOG_IF(ERROR, !s.ok()) << "stop span server fail: " << s.ToString();
  }
}

Status RemoteTracing::GetTree(TreeSPtr* tree) const {
  if (root_ == nullptr) {
    return Status::NotFound("tracing has no root span yet");
  }

  *tree = std::make_shared<RemoteTree>(client_, root_->Id());
  return Status::OK();
}

}  // namespace tracetree
