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

#include "trace/remote/remote_span.h"

#include "common/logging.h"
#include "common/options/trace.h"
#include "utils/json_util.h"

namespace tracetree {

static Status GetRecord(remote::SpanClient* client, const SpanId& id,
                        SpanRecord* record) {
  Status s = client->GetSpan(id, record);
  CHECK(!s.IsNotFound()) << "span missing on server, id: " << id.ToString()
                         << ", server: " << client->Url();
  return s;
}

Status RemoteSpan::FromReference(const SpanRef& ref, SpanSPtr* span) {
  if (ref.kind != BackendKind::kRemote) {
    return Status::InvalidParam("not a remote span reference");
  }

  auto client = std::make_shared<remote::SpanClient>(ref.locator);
  TRACETREE_RETURN_NOT_OK(client->Init());

  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(client->GetSpan(ref.id, &record));

  *span = std::make_shared<RemoteSpan>(client, ref.id);
  return Status::OK();
}

Status RemoteSpan::Name(std::string* name) const {
  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(GetRecord(client_.get(), id_, &record));
  *name = std::move(record.name);
  return Status::OK();
}

Status RemoteSpan::Data(Json::Value* data) const {
  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(GetRecord(client_.get(), id_, &record));
  return utils::StringToJsonObject(record.data_json, data);
}

Status RemoteSpan::NewChild(const std::string& name, const Json::Value& data,
                            SpanSPtr* child) {
  SpanRecord record;
  record.id = NewSpanId();
  record.name = name.empty() ? FLAGS_trace_default_span_name : name;
  record.data_json = utils::JsonToString(
      data.isObject() ? data : Json::Value(Json::objectValue));
  record.parent_id = id_;

  TRACETREE_RETURN_NOT_OK(client_->PutSpan(record));

  *child = std::make_shared<RemoteSpan>(client_, record.id);
  return Status::OK();
}

Status RemoteSpan::UpdateData(const Json::Value& patch) {
  if (!patch.isObject()) {
    return Status::InvalidParam("span data patch must be an object");
  }

  Status s = client_->PatchSpan(id_, utils::JsonToString(patch));
  CHECK(!s.IsNotFound()) << "span missing on server, id: " << id_.ToString()
                         << ", server: " << client_->Url();
  return s;
}

SpanRef RemoteSpan::Reference() const {
  SpanRef ref;
  ref.kind = BackendKind::kRemote;
  ref.id = id_;
  ref.locator = client_->Url();
  return ref;
}

Status RemoteTree::Get(SpanRecord* record) const {
  return GetRecord(client_.get(), id_, record);
}

Status RemoteTree::Name(std::string* name) const {
  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(Get(&record));
  *name = std::move(record.name);
  return Status::OK();
}

Status RemoteTree::Data(Json::Value* data) const {
  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(Get(&record));
  return utils::StringToJsonObject(record.data_json, data);
}

Status RemoteTree::Children(std::vector<TreeSPtr>* children) const {
  std::vector<SpanId> ids;
  TRACETREE_RETURN_NOT_OK(client_->GetChildrenIds(id_, &ids));

  children->clear();
  for (const auto& id : ids) {
    children->push_back(std::make_shared<RemoteTree>(client_, id));
  }
  return Status::OK();
}

Status RemoteTree::Parent(TreeSPtr* parent) const {
  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(Get(&record));

  if (record.parent_id.has_value()) {
    *parent = std::make_shared<RemoteTree>(client_, *record.parent_id);
  } else {
    *parent = nullptr;
  }
  return Status::OK();
}

}  // namespace tracetree
