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

#include "trace/jsonlog/jsonlog_span.h"

#include "common/logging.h"
#include "common/options/trace.h"
#include "utils/merge_patch.h"

namespace tracetree {

JsonLogSpan::JsonLogSpan(JsonLogWriterSPtr writer, const SpanId& id,
                         const std::string& name, const Json::Value& data,
                         std::optional<SpanId> parent_id, bool closed)
    : writer_(std::move(writer)),
      id_(id),
      name_(name),
      parent_id_(parent_id),
      data_(data.isObject() ? data : Json::Value(Json::objectValue)),
      closed_(closed) {}

Status JsonLogSpan::FromReference(const SpanRef& ref, SpanSPtr* span) {
  if (ref.kind != BackendKind::kJsonLog) {
    return Status::InvalidParam("not a jsonlog span reference");
  }

  const Json::Value& snapshot = ref.snapshot;
  if (!snapshot.isObject() || !snapshot[kJsonLogNameKey].isString()) {
    return Status::InvalidParam("jsonlog span reference without snapshot");
  }

  std::optional<SpanId> parent_id;
  if (snapshot[kJsonLogParentIdKey].isString()) {
    SpanId id;
    TRACETREE_RETURN_NOT_OK(
        SpanId::FromString(snapshot[kJsonLogParentIdKey].asString(), &id));
    parent_id = id;
  }

  JsonLogWriterSPtr writer;
  TRACETREE_RETURN_NOT_OK(JsonLogWriter::GetOrOpen(ref.locator, &writer));

  *span = std::make_shared<JsonLogSpan>(
      writer, ref.id, snapshot[kJsonLogNameKey].asString(),
      snapshot[kJsonLogDataKey], parent_id, true);
  return Status::OK();
}

Status JsonLogSpan::Name(std::string* name) const {
  *name = name_;
  return Status::OK();
}

Status JsonLogSpan::Data(Json::Value* data) const {
  std::lock_guard<std::mutex> lock(mutex_);
  *data = data_;
  return Status::OK();
}

Status JsonLogSpan::NewChild(const std::string& name, const Json::Value& data,
                             SpanSPtr* child) {
  *child = std::make_shared<JsonLogSpan>(
      writer_, NewSpanId(),
      name.empty() ? FLAGS_trace_default_span_name : name, data, id_, false);
  return Status::OK();
}

Status JsonLogSpan::UpdateData(const Json::Value& patch) {
  if (!patch.isObject()) {
    return Status::InvalidParam("span data patch must be an object");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ApplyMergePatch(&data_, patch);

  if (closed_) {
    return writer_->Write(ToLine());
  }
  return Status::OK();
}

void JsonLogSpan::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) return;

  closed_ = true;
  Status s = writer_->Write(ToLine());
  LOG_IF(ERROR, !s.ok()) << "write span fail, id: " << id_.ToString()
                         << ", status: " << s.ToString();
}

SpanRef JsonLogSpan::Reference() const {
  SpanRef ref;
  ref.kind = BackendKind::kJsonLog;
  ref.id = id_;
  ref.locator = writer_->Path();

  std::lock_guard<std::mutex> lock(mutex_);
  ref.snapshot = ToLine();
  return ref;
}

// caller holds mutex_
Json::Value JsonLogSpan::ToLine() const {
  Json::Value line(Json::objectValue);
  line[kJsonLogIdKey] = id_.ToString();
  line[kJsonLogNameKey] = name_;
  line[kJsonLogParentIdKey] = parent_id_.has_value()
                                  ? Json::Value(parent_id_->ToString())
                                  : Json::Value(Json::nullValue);
  line[kJsonLogDataKey] = data_;
  return line;
}

}  // namespace tracetree
