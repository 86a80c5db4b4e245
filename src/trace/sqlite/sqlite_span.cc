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

#include "trace/sqlite/sqlite_span.h"

#include "common/logging.h"
#include "common/options/trace.h"
#include "utils/json_util.h"

namespace tracetree {

static Status GetRecord(SpanDatabase* db, const SpanId& id,
                        SpanRecord* record) {
  Status s = db->GetSpan(id, record);
  CHECK(!s.IsNotFound()) << "span row disappeared, id: " << id.ToString()
                         << ", db: " << db->Path();
  return s;
}

Status SqliteSpan::FromReference(const SpanRef& ref, SpanSPtr* span) {
  if (ref.kind != BackendKind::kSqlite) {
    return Status::InvalidParam("not a sqlite span reference");
  }

  auto db = std::make_shared<SpanDatabase>(ref.locator);
  TRACETREE_RETURN_NOT_OK(db->Init());

  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(db->GetSpan(ref.id, &record));

  *span = std::make_shared<SqliteSpan>(db, ref.id);
  return Status::OK();
}

Status SqliteSpan::Get(SpanRecord* record) const {
  return GetRecord(db_.get(), id_, record);
}

Status SqliteSpan::Name(std::string* name) const {
  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(Get(&record));
  *name = std::move(record.name);
  return Status::OK();
}

Status SqliteSpan::Data(Json::Value* data) const {
  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(Get(&record));
  return utils::StringToJsonObject(record.data_json, data);
}

Status SqliteSpan::NewChild(const std::string& name, const Json::Value& data,
                            SpanSPtr* child) {
  SpanRecord record;
  record.id = NewSpanId();
  record.name = name.empty() ? FLAGS_trace_default_span_name : name;
  record.data_json = utils::JsonToString(
      data.isObject() ? data : Json::Value(Json::objectValue));
  record.parent_id = id_;

  TRACETREE_RETURN_NOT_OK(db_->Insert(record));

  *child = std::make_shared<SqliteSpan>(db_, record.id);
  return Status::OK();
}

Status SqliteSpan::UpdateData(const Json::Value& patch) {
  if (!patch.isObject()) {
    return Status::InvalidParam("span data patch must be an object");
  }

  Status s = db_->UpdateDataJson(id_, utils::JsonToString(patch));
  CHECK(!s.IsNotFound()) << "span row disappeared, id: " << id_.ToString()
                         << ", db: " << db_->Path();
  return s;
}

SpanRef SqliteSpan::Reference() const {
  SpanRef ref;
  ref.kind = BackendKind::kSqlite;
  ref.id = id_;
  ref.locator = db_->Path();
  return ref;
}

Status SqliteTree::Get(SpanRecord* record) const {
  return GetRecord(db_.get(), id_, record);
}

Status SqliteTree::Name(std::string* name) const {
  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(Get(&record));
  *name = std::move(record.name);
  return Status::OK();
}

Status SqliteTree::Data(Json::Value* data) const {
  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(Get(&record));
  return utils::StringToJsonObject(record.data_json, data);
}

Status SqliteTree::Children(std::vector<TreeSPtr>* children) const {
  std::vector<SpanId> ids;
  TRACETREE_RETURN_NOT_OK(db_->GetChildrenIds(id_, &ids));

  children->clear();
  children->reserve(ids.size());
  for (const auto& id : ids) {
    children->push_back(std::make_shared<SqliteTree>(db_, id));
  }
  return Status::OK();
}

Status SqliteTree::Parent(TreeSPtr* parent) const {
  SpanRecord record;
  TRACETREE_RETURN_NOT_OK(Get(&record));

  if (record.parent_id.has_value()) {
    *parent = std::make_shared<SqliteTree>(db_, *record.parent_id);
  } else {
    *parent = nullptr;
  }
  return Status::OK();
}

}  // namespace tracetree
