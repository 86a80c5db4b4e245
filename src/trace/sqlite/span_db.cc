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

#include "trace/sqlite/span_db.h"

#include <filesystem>

#include "common/logging.h"
#include "common/options/trace.h"
#include "fmt/format.h"
#include "trace/sqlite/sqlite_conn.h"

namespace tracetree {

static const char* const kInitSql = R"(
CREATE TABLE IF NOT EXISTS trace_spans (
  id BLOB PRIMARY KEY,
  parent_id BLOB,
  name TEXT NOT NULL,
  data_json TEXT NOT NULL,
  last_updated REAL
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS trace_spans_parent_id_idx
  ON trace_spans (parent_id);

CREATE INDEX IF NOT EXISTS trace_spans_last_updated_idx
  ON trace_spans (last_updated);

CREATE TRIGGER IF NOT EXISTS trace_spans_insert_trigger
AFTER INSERT ON trace_spans
BEGIN
  UPDATE trace_spans SET last_updated = MAX(
    (julianday('now') - 2440587.5) * 86400.0,
    IFNULL((SELECT MAX(last_updated) FROM trace_spans), 0) + 0.000001)
  WHERE id = NEW.id;
END;

CREATE TRIGGER IF NOT EXISTS trace_spans_update_trigger
AFTER UPDATE OF data_json, name, parent_id ON trace_spans
BEGIN
  UPDATE trace_spans SET last_updated = MAX(
    (julianday('now') - 2440587.5) * 86400.0,
    IFNULL((SELECT MAX(last_updated) FROM trace_spans), 0) + 0.000001)
  WHERE id = NEW.id;
END;
)";

SpanDatabase::SpanDatabase(const std::string& path) : path_(path) {}

Status SpanDatabase::Connect(std::unique_ptr<sqlite::Connection>* conn) {
  auto opened = std::make_unique<sqlite::Connection>(path_);
  TRACETREE_RETURN_NOT_OK(opened->Open(FLAGS_trace_sqlite_busy_timeout_ms));
  *conn = std::move(opened);
  return Status::OK();
}

Status SpanDatabase::Init() {
  std::error_code ec;
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return Status::IoError(ec.value(), "create db dir fail",
                             parent.string());
    }
  }

  std::unique_ptr<sqlite::Connection> conn;
  TRACETREE_RETURN_NOT_OK(Connect(&conn));
  TRACETREE_RETURN_NOT_OK(conn->Exec("PRAGMA journal_mode=WAL;"));
  TRACETREE_RETURN_NOT_OK(conn->Exec(kInitSql));

  LOG(INFO) << "span database initialized, path: " << path_;

  return Status::OK();
}

Status SpanDatabase::Insert(const SpanRecord& record) {
  std::unique_ptr<sqlite::Connection> conn;
  TRACETREE_RETURN_NOT_OK(Connect(&conn));

  sqlite::Statement stmt(conn.get());
  TRACETREE_RETURN_NOT_OK(stmt.Prepare(
      "INSERT INTO trace_spans (id, parent_id, name, data_json) "
      "VALUES (?, ?, ?, ?);"));
  TRACETREE_RETURN_NOT_OK(stmt.BindId(1, record.id));
  TRACETREE_RETURN_NOT_OK(stmt.BindOptionalId(2, record.parent_id));
  TRACETREE_RETURN_NOT_OK(stmt.BindText(3, record.name));
  TRACETREE_RETURN_NOT_OK(stmt.BindText(4, record.data_json));

  Status s = stmt.Execute();
  if (s.IsExist()) {
    return Status::Exist("span already exists", record.id.ToString());
  }
  return s;
}

Status SpanDatabase::InsertOrUpdate(const SpanRecord& record) {
  std::unique_ptr<sqlite::Connection> conn;
  TRACETREE_RETURN_NOT_OK(Connect(&conn));

  sqlite::Statement stmt(conn.get());
  TRACETREE_RETURN_NOT_OK(stmt.Prepare(
      "INSERT INTO trace_spans (id, parent_id, name, data_json) "
      "VALUES (?, ?, ?, ?) "
      "ON CONFLICT (id) DO UPDATE SET "
      "data_json = json_patch(data_json, excluded.data_json);"));
  TRACETREE_RETURN_NOT_OK(stmt.BindId(1, record.id));
  TRACETREE_RETURN_NOT_OK(stmt.BindOptionalId(2, record.parent_id));
  TRACETREE_RETURN_NOT_OK(stmt.BindText(3, record.name));
  TRACETREE_RETURN_NOT_OK(stmt.BindText(4, record.data_json));

  return stmt.Execute();
}

Status SpanDatabase::GetSpan(const SpanId& id, SpanRecord* record) {
  std::unique_ptr<sqlite::Connection> conn;
  TRACETREE_RETURN_NOT_OK(Connect(&conn));

  sqlite::Statement stmt(conn.get());
  TRACETREE_RETURN_NOT_OK(stmt.Prepare(
      "SELECT id, parent_id, name, data_json FROM trace_spans WHERE id = ?;"));
  TRACETREE_RETURN_NOT_OK(stmt.BindId(1, id));

  bool has_row = false;
  TRACETREE_RETURN_NOT_OK(stmt.Step(&has_row));
  if (!has_row) {
    return Status::NotFound("span not found", id.ToString());
  }

  TRACETREE_RETURN_NOT_OK(stmt.ColumnId(0, &record->id));
  if (stmt.ColumnIsNull(1)) {
    record->parent_id = std::nullopt;
  } else {
    SpanId parent_id;
    TRACETREE_RETURN_NOT_OK(stmt.ColumnId(1, &parent_id));
    record->parent_id = parent_id;
  }
  record->name = stmt.ColumnText(2);
  record->data_json = stmt.ColumnText(3);

  return Status::OK();
}

Status SpanDatabase::QueryIds(const std::string& sql,
                              const std::optional<SpanId>& id_arg,
                              const std::optional<std::string>& text_arg,
                              std::vector<SpanId>* ids) {
  std::unique_ptr<sqlite::Connection> conn;
  TRACETREE_RETURN_NOT_OK(Connect(&conn));

  sqlite::Statement stmt(conn.get());
  TRACETREE_RETURN_NOT_OK(stmt.Prepare(sql));
  if (id_arg.has_value()) {
    TRACETREE_RETURN_NOT_OK(stmt.BindId(1, *id_arg));
  } else if (text_arg.has_value()) {
    TRACETREE_RETURN_NOT_OK(stmt.BindText(1, *text_arg));
  }

  ids->clear();
  bool has_row = false;
  TRACETREE_RETURN_NOT_OK(stmt.Step(&has_row));
  while (has_row) {
    SpanId id;
    TRACETREE_RETURN_NOT_OK(stmt.ColumnId(0, &id));
    ids->push_back(id);
    TRACETREE_RETURN_NOT_OK(stmt.Step(&has_row));
  }

  return Status::OK();
}

Status SpanDatabase::GetRootIds(std::vector<SpanId>* ids) {
  return QueryIds(
      "SELECT id FROM trace_spans WHERE parent_id IS NULL ORDER BY id;",
      std::nullopt, std::nullopt, ids);
}

Status SpanDatabase::GetChildrenIds(const SpanId& id,
                                    std::vector<SpanId>* ids) {
  return QueryIds(
      "SELECT id FROM trace_spans WHERE parent_id = ? ORDER BY id;", id,
      std::nullopt, ids);
}

Status SpanDatabase::GetSpanIdsByName(const std::string& name,
                                      std::vector<SpanId>* ids) {
  return QueryIds("SELECT id FROM trace_spans WHERE name = ? ORDER BY id;",
                  std::nullopt, name, ids);
}

Status SpanDatabase::UpdateDataJson(const SpanId& id,
                                    const std::string& patch_json) {
  std::unique_ptr<sqlite::Connection> conn;
  TRACETREE_RETURN_NOT_OK(Connect(&conn));

  sqlite::Statement stmt(conn.get());
  TRACETREE_RETURN_NOT_OK(stmt.Prepare(
      "UPDATE trace_spans SET data_json = json_patch(data_json, ?) "
      "WHERE id = ?;"));
  TRACETREE_RETURN_NOT_OK(stmt.BindText(1, patch_json));
  TRACETREE_RETURN_NOT_OK(stmt.BindId(2, id));
  TRACETREE_RETURN_NOT_OK(stmt.Execute());

  if (conn->Changes() == 0) {
    return Status::NotFound("span not found", id.ToString());
  }
  return Status::OK();
}

Status SpanDatabase::GetLastUpdatedSpanId(SpanId* id, double* last_updated) {
  std::unique_ptr<sqlite::Connection> conn;
  TRACETREE_RETURN_NOT_OK(Connect(&conn));

  sqlite::Statement stmt(conn.get());
  TRACETREE_RETURN_NOT_OK(stmt.Prepare(
      "SELECT id, last_updated FROM trace_spans "
      "ORDER BY last_updated DESC LIMIT 1;"));

  bool has_row = false;
  TRACETREE_RETURN_NOT_OK(stmt.Step(&has_row));
  if (!has_row) {
    return Status::NotFound("no span in database");
  }

  TRACETREE_RETURN_NOT_OK(stmt.ColumnId(0, id));
  *last_updated = stmt.ColumnDouble(1);
  return Status::OK();
}

Status SpanDatabase::GetLastSpanId(SpanId* id) {
  std::unique_ptr<sqlite::Connection> conn;
  TRACETREE_RETURN_NOT_OK(Connect(&conn));

  sqlite::Statement stmt(conn.get());
  TRACETREE_RETURN_NOT_OK(
      stmt.Prepare("SELECT id FROM trace_spans ORDER BY id DESC LIMIT 1;"));

  bool has_row = false;
  TRACETREE_RETURN_NOT_OK(stmt.Step(&has_row));
  if (!has_row) {
    return Status::NotFound("no span in database");
  }

  return stmt.ColumnId(0, id);
}

Status SpanDatabase::WalCheckpoint() {
  std::unique_ptr<sqlite::Connection> conn;
  TRACETREE_RETURN_NOT_OK(Connect(&conn));

  int log_frames = 0;
  int checkpointed = 0;
  int rc = sqlite3_wal_checkpoint_v2(conn->Handle(), nullptr,
                                     SQLITE_CHECKPOINT_TRUNCATE, &log_frames,
                                     &checkpointed);
  TRACETREE_RETURN_NOT_OK(sqlite::ToStatus(rc, conn->Handle(), "checkpoint"));

  LOG(INFO) << fmt::format("wal checkpoint done, path({}) frames({}/{}).",
                           path_, checkpointed, log_frames);
  return Status::OK();
}

}  // namespace tracetree
