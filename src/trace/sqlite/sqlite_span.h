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

#ifndef TRACETREE_TRACE_SQLITE_SQLITE_SPAN_H_
#define TRACETREE_TRACE_SQLITE_SQLITE_SPAN_H_

#include <json/json.h>

#include <string>
#include <vector>

#include "trace/span.h"
#include "trace/sqlite/span_db.h"

namespace tracetree {

// Handle of a span row, every read goes to the database. The row of a
// handle always exists, a missing row is a fatal error.
class SqliteSpan : public Span {
 public:
  SqliteSpan(SpanDatabaseSPtr db, const SpanId& id)
      : db_(std::move(db)), id_(id) {}

  // NotFound when the referenced row does not exist.
  static Status FromReference(const SpanRef& ref, SpanSPtr* span);

  const SpanId& Id() const override { return id_; }

  Status Name(std::string* name) const override;

  Status Data(Json::Value* data) const override;

  Status NewChild(const std::string& name, const Json::Value& data,
                  SpanSPtr* child) override;

  Status UpdateData(const Json::Value& patch) override;

  SpanRef Reference() const override;

  std::string Backend() const override { return "sqlite"; }

 private:
  Status Get(SpanRecord* record) const;

  SpanDatabaseSPtr db_;
  const SpanId id_;
};

class SqliteTree : public Tree {
 public:
  SqliteTree(SpanDatabaseSPtr db, const SpanId& id)
      : db_(std::move(db)), id_(id) {}

  Status Name(std::string* name) const override;

  Status Data(Json::Value* data) const override;

  Status Children(std::vector<TreeSPtr>* children) const override;

  Status Parent(TreeSPtr* parent) const override;

  const SpanId& Id() const { return id_; }

 private:
  Status Get(SpanRecord* record) const;

  SpanDatabaseSPtr db_;
  const SpanId id_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_SQLITE_SQLITE_SPAN_H_
