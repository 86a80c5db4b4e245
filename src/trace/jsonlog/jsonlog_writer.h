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

#ifndef TRACETREE_TRACE_JSONLOG_JSONLOG_WRITER_H_
#define TRACETREE_TRACE_JSONLOG_JSONLOG_WRITER_H_

#include <json/json.h>
#include <spdlog/logger.h>

#include <memory>
#include <string>

#include "common/status.h"

namespace tracetree {

class JsonLogWriter;
using JsonLogWriterSPtr = std::shared_ptr<JsonLogWriter>;

// Appends one json document per line to a trace log file. Several processes
// may append to the same file.
class JsonLogWriter {
 public:
  explicit JsonLogWriter(const std::string& path) : path_(path) {}
  ~JsonLogWriter();

  Status Open();

  Status Write(const Json::Value& line);

  const std::string& Path() const { return path_; }

  // One opened writer per path and process.
  static Status GetOrOpen(const std::string& path, JsonLogWriterSPtr* writer);

 private:
  const std::string path_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_JSONLOG_JSONLOG_WRITER_H_
