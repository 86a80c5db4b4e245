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

#include "trace/tracing.h"

#include "common/logging.h"
#include "trace/constants.h"
#include "trace/context.h"
#include "utils/time.h"

namespace tracetree {

Tracing::~Tracing() {
  LOG_IF(WARNING, state_ == State::kActive)
      << "tracing destroyed while still active.";
}

Status Tracing::Enter() {
  if (state_ != State::kInactive) {
    return Status::Abort("tracing can only be entered once");
  }

  TRACETREE_RETURN_NOT_OK(OnEnter());

  SpanSPtr root = RootSpan();
  CHECK(root != nullptr) << "tracing has no root span after enter.";

  Json::Value patch(Json::objectValue);
  patch[kStartTimeKey] = utils::GetNowFormatTime();
  Status s = root->UpdateData(patch);
  if (!s.ok()) {
    LOG(ERROR) << "record root start time fail, status: " << s.ToString();
    OnExit();
    return s;
  }

  prev_span_ = SwapCurrentSpan(root);
  state_ = State::kActive;

  LOG(INFO) << "enter " << root->Backend()
            << " tracing, root: " << root->Id().ToString();

  return Status::OK();
}

Status Tracing::Exit() {
  if (state_ != State::kActive) {
    return Status::OK();
  }

  SpanSPtr root = RootSpan();

  Json::Value patch(Json::objectValue);
  patch[kEndTimeKey] = utils::GetNowFormatTime();
  Status s = root->UpdateData(patch);
  if (!s.ok()) {
    LOG(ERROR) << "record root end time fail, status: " << s.ToString();
  }
  root->Close();

  SwapCurrentSpan(std::move(prev_span_));
  state_ = State::kExited;

  OnExit();

  LOG(INFO) << "exit " << root->Backend()
            << " tracing, root: " << root->Id().ToString();

  return s;
}

TracingScope::TracingScope(Tracing* tracing)
    : tracing_(tracing), status_(tracing->Enter()) {
  LOG_IF(ERROR, !status_.ok())
      << "enter tracing fail, status: " << status_.ToString();
}

TracingScope::~TracingScope() {
  if (status_.ok()) {
    Status s = tracing_->Exit();
    LOG_IF(ERROR, !s.ok()) << "exit tracing fail, status: " << s.ToString();
  }
}

}  // namespace tracetree
