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

#include "trace/sqlite/sqlite_conn.h"

#include "common/logging.h"
#include "fmt/format.h"

namespace tracetree {
namespace sqlite {

Status ToStatus(int rc, sqlite3* db, std::string_view what) {
  if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) {
    return Status::OK();
  }

  std::string msg = fmt::format(
      "{} fail, {}", what,
      (db != nullptr) ? sqlite3_errmsg(db) : sqlite3_errstr(rc));

  switch (rc & 0xFF) {
    case SQLITE_CONSTRAINT:
      return Status::Exist(rc, msg);
    case SQLITE_FULL:
      return Status::NoSpace(rc, msg);
    case SQLITE_PERM:
    case SQLITE_READONLY:
    case SQLITE_AUTH:
      return Status::NoPermission(rc, msg);
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Status::Timeout(rc, msg);
    case SQLITE_ERROR:
    case SQLITE_MISUSE:
    case SQLITE_RANGE:
    case SQLITE_MISMATCH:
      return Status::Internal(rc, msg);
    default:
      return Status::IoError(rc, msg);
  }
}

Connection::~Connection() {
  if (db_ != nullptr) {
    int rc = sqlite3_close(db_);
    LOG_IF(ERROR, rc != SQLITE_OK)
        << "close sqlite db fail, path: " << path_ << ", rc: " << rc;
  }
}

Status Connection::Open(int busy_timeout_ms) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    Status s = ToStatus(rc, db_, fmt::format("open db {}", path_));
    // a handle is returned even on failure
    sqlite3_close(db_);
    db_ = nullptr;
    return s;
  }

  rc = sqlite3_busy_timeout(db_, busy_timeout_ms);
  return ToStatus(rc, db_, "set busy timeout");
}

Status Connection::Exec(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (err != nullptr) {
    LOG(ERROR) << "exec sql fail, error: " << err;
    sqlite3_free(err);
  }
  return ToStatus(rc, db_, "exec sql");
}

Statement::~Statement() {
  if (stmt_ != nullptr) sqlite3_finalize(stmt_);
}

Status Statement::Prepare(std::string_view sql) {
  int rc = sqlite3_prepare_v2(conn_->Handle(), sql.data(),
                              static_cast<int>(sql.size()), &stmt_, nullptr);
  return ToStatus(rc, conn_->Handle(), "prepare statement");
}

Status Statement::BindId(int index, const SpanId& id) {
  int rc = sqlite3_bind_blob(stmt_, index, id.bytes().data(),
                             static_cast<int>(id.bytes().size()),
                             SQLITE_TRANSIENT);
  return ToStatus(rc, conn_->Handle(), "bind id");
}

Status Statement::BindOptionalId(int index, const std::optional<SpanId>& id) {
  if (id.has_value()) return BindId(index, *id);

  int rc = sqlite3_bind_null(stmt_, index);
  return ToStatus(rc, conn_->Handle(), "bind null");
}

Status Statement::BindText(int index, std::string_view text) {
  int rc = sqlite3_bind_text(stmt_, index, text.data(),
                             static_cast<int>(text.size()), SQLITE_TRANSIENT);
  return ToStatus(rc, conn_->Handle(), "bind text");
}

Status Statement::Step(bool* has_row) {
  int rc = sqlite3_step(stmt_);
  *has_row = (rc == SQLITE_ROW);
  return ToStatus(rc, conn_->Handle(), "step statement");
}

Status Statement::Execute() {
  bool has_row = false;
  return Step(&has_row);
}

bool Statement::ColumnIsNull(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Status Statement::ColumnId(int column, SpanId* id) const {
  const void* blob = sqlite3_column_blob(stmt_, column);
  int size = sqlite3_column_bytes(stmt_, column);
  if (blob == nullptr) {
    return Status::Internal("id column is null");
  }
  return SpanId::FromBytes(
      std::string_view(static_cast<const char*>(blob), size), id);
}

std::string Statement::ColumnText(int column) const {
  const unsigned char* text = sqlite3_column_text(stmt_, column);
  int size = sqlite3_column_bytes(stmt_, column);
  return (text != nullptr)
             ? std::string(reinterpret_cast<const char*>(text), size)
             : std::string();
}

double Statement::ColumnDouble(int column) const {
  return sqlite3_column_double(stmt_, column);
}

}  // namespace sqlite
}  // namespace tracetree
