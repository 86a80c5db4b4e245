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

#include "trace/sqlite/sqlite_tracing.h"

#include "common/logging.h"
#include "common/options/trace.h"

namespace tracetree {

SqliteTracing::SqliteTracing(const std::string& db_path)
    : SqliteTracing(db_path, FLAGS_trace_root_name) {}

SqliteTracing::SqliteTracing(const std::string& db_path,
                             const std::string& root_name)
    : db_(std::make_shared<SpanDatabase>(db_path)), root_name_(root_name) {}

SqliteTracing::SqliteTracing(const std::string& db_path,
                             const SpanId& root_id)
    : db_(std::make_shared<SpanDatabase>(db_path)),
      existing_root_id_(root_id) {}

Status SqliteTracing::Init() {
  if (root_ != nullptr) return Status::OK();

  TRACETREE_RETURN_NOT_OK(db_->Init());

  if (existing_root_id_.has_value()) {
    SpanRecord record;
    TRACETREE_RETURN_NOT_OK(db_->GetSpan(*existing_root_id_, &record));
    if (record.parent_id.has_value()) {
      return Status::InvalidParam("span is not a root",
                                  existing_root_id_->ToString());
    }
    root_ = std::make_shared<SqliteSpan>(db_, *existing_root_id_);
    return Status::OK();
  }

  SpanRecord record;
  record.id = NewSpanId();
  record.name = root_name_;
  record.data_json = "{}";
  TRACETREE_RETURN_NOT_OK(db_->Insert(record));

  LOG(INFO) << "create root span " << record.id.ToString()
            << " in: " << db_->Path();

  root_ = std::make_shared<SqliteSpan>(db_, record.id);
  return Status::OK();
}

Status SqliteTracing::OnEnter() { return Init(); }

Status SqliteTracing::GetTree(TreeSPtr* tree) const {
  if (root_ == nullptr) {
    return Status::NotFound("tracing has no root span yet");
  }

  *tree = std::make_shared<SqliteTree>(db_, root_->Id());
  return Status::OK();
}

}  // namespace tracetree
