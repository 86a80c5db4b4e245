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

#ifndef TRACETREE_TRACE_SQLITE_SPAN_DB_H_
#define TRACETREE_TRACE_SQLITE_SPAN_DB_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/status.h"
#include "utils/span_id.h"

namespace tracetree {

namespace sqlite {
class Connection;
}  // namespace sqlite

// One row of the span table, data is raw json text.
struct SpanRecord {
  SpanId id;
  std::string name;
  std::string data_json;
  std::optional<SpanId> parent_id;
};

// Span table in a sqlite file. Every call opens its own connection, so one
// SpanDatabase may be shared by threads and several processes may use the
// same file. The database runs in WAL mode.
class SpanDatabase {
 public:
  explicit SpanDatabase(const std::string& path);

  // Create the schema if missing.
  Status Init();

  const std::string& Path() const { return path_; }

  // Exist if the id is present.
  Status Insert(const SpanRecord& record);

  // Insert, or merge patch data_json into an existing row. name and
  // parent_id of an existing row are kept.
  Status InsertOrUpdate(const SpanRecord& record);

  // NotFound if missing.
  Status GetSpan(const SpanId& id, SpanRecord* record);

  Status GetRootIds(std::vector<SpanId>* ids);

  // Ordered by id.
  Status GetChildrenIds(const SpanId& id, std::vector<SpanId>* ids);

  // Merge patch done by sqlite json_patch(), NotFound if missing.
  Status UpdateDataJson(const SpanId& id, const std::string& patch_json);

  // The most recently inserted or updated span, NotFound on an empty table.
  Status GetLastUpdatedSpanId(SpanId* id, double* last_updated);

  Status GetSpanIdsByName(const std::string& name, std::vector<SpanId>* ids);

  // The greatest id, i.e. the newest span. NotFound on an empty table.
  Status GetLastSpanId(SpanId* id);

  // Move the WAL content into the database file.
  Status WalCheckpoint();

 private:
  Status Connect(std::unique_ptr<sqlite::Connection>* conn);

  Status QueryIds(const std::string& sql, const std::optional<SpanId>& id_arg,
                  const std::optional<std::string>& text_arg,
                  std::vector<SpanId>* ids);

  const std::string path_;
};

using SpanDatabaseSPtr = std::shared_ptr<SpanDatabase>;

}  // namespace tracetree

#endif  // TRACETREE_TRACE_SQLITE_SPAN_DB_H_
