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

#ifndef TRACETREE_TRACE_SQLITE_SQLITE_TRACING_H_
#define TRACETREE_TRACE_SQLITE_SQLITE_TRACING_H_

#include <optional>
#include <string>

#include "trace/sqlite/span_db.h"
#include "trace/sqlite/sqlite_span.h"
#include "trace/tracing.h"

namespace tracetree {

// Spans are rows of a sqlite database, shared by every thread and process
// using the same file.
//
// Init() creates the schema and the root row, or attaches to an existing
// root. Enter() calls Init() when it has not run yet.
class SqliteTracing : public Tracing {
 public:
  explicit SqliteTracing(const std::string& db_path);
  SqliteTracing(const std::string& db_path, const std::string& root_name);
  // Continue a trace whose root is already stored.
  SqliteTracing(const std::string& db_path, const SpanId& root_id);

  Status Init();

  SpanSPtr RootSpan() const override { return root_; }

  Status GetTree(TreeSPtr* tree) const override;

  const SpanDatabaseSPtr& Database() const { return db_; }

 protected:
  Status OnEnter() override;

 private:
  SpanDatabaseSPtr db_;
  const std::string root_name_;
  const std::optional<SpanId> existing_root_id_;
  std::shared_ptr<SqliteSpan> root_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_SQLITE_SQLITE_TRACING_H_
