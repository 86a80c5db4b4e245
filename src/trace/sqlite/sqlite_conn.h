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

#ifndef TRACETREE_TRACE_SQLITE_SQLITE_CONN_H_
#define TRACETREE_TRACE_SQLITE_SQLITE_CONN_H_

#include <sqlite3.h>

#include <optional>
#include <string>
#include <string_view>

#include "common/status.h"
#include "utils/span_id.h"

namespace tracetree {
namespace sqlite {

// Translate a sqlite result code into a Status.
Status ToStatus(int rc, sqlite3* db, std::string_view what);

// A short-lived sqlite connection, closed on destruction.
class Connection {
 public:
  explicit Connection(const std::string& path) : path_(path) {}
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  Status Open(int busy_timeout_ms);

  // Run one or more statements without result rows.
  Status Exec(const std::string& sql);

  // Rows changed by the last statement.
  int Changes() const { return sqlite3_changes(db_); }

  sqlite3* Handle() const { return db_; }

  const std::string& Path() const { return path_; }

 private:
  const std::string path_;
  sqlite3* db_{nullptr};
};

// A prepared statement, finalized on destruction. Bind indexes start at 1,
// column indexes at 0.
class Statement {
 public:
  explicit Statement(Connection* conn) : conn_(conn) {}
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Status Prepare(std::string_view sql);

  Status BindId(int index, const SpanId& id);
  Status BindOptionalId(int index, const std::optional<SpanId>& id);
  Status BindText(int index, std::string_view text);

  // Sets has_row when a row is ready to be read.
  Status Step(bool* has_row);

  // Step a statement that returns no row.
  Status Execute();

  bool ColumnIsNull(int column) const;
  Status ColumnId(int column, SpanId* id) const;
  std::string ColumnText(int column) const;
  double ColumnDouble(int column) const;

 private:
  Connection* conn_;
  sqlite3_stmt* stmt_{nullptr};
};

}  // namespace sqlite
}  // namespace tracetree

#endif  // TRACETREE_TRACE_SQLITE_SQLITE_CONN_H_
