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

#include "trace/jsonlog/jsonlog_writer.h"

#include <absl/strings/str_format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <unistd.h>

#include <filesystem>
#include <map>
#include <mutex>
#include <utility>

#include "common/logging.h"
#include "utils/json_util.h"

namespace tracetree {

JsonLogWriter::~JsonLogWriter() {
  if (logger_ != nullptr) logger_->flush();
}

Status JsonLogWriter::Open() {
  if (logger_ != nullptr) return Status::OK();

  std::error_code ec;
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return Status::IoError(ec.value(), "create trace log dir fail",
                             parent.string());
    }
  }

  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_);
    logger_ = std::make_shared<spdlog::logger>(
        absl::StrFormat("jsonlog_%d", getpid()), std::move(sink));
  } catch (const spdlog::spdlog_ex& e) {
    return Status::IoError("open trace log fail", e.what());
  }

  logger_->set_pattern("%v");
  logger_->set_level(spdlog::level::info);
  logger_->flush_on(spdlog::level::info);

  LOG(INFO) << "open trace log: " << path_;

  return Status::OK();
}

Status JsonLogWriter::Write(const Json::Value& line) {
  if (logger_ == nullptr) {
    return Status::Internal("trace log not opened", path_);
  }

  logger_->info(utils::JsonToString(line));
  return Status::OK();
}

Status JsonLogWriter::GetOrOpen(const std::string& path,
                                JsonLogWriterSPtr* writer) {
  static std::mutex mutex;
  static std::map<std::pair<pid_t, std::string>, JsonLogWriterSPtr> writers;

  // writers inherited through fork are never reused
  auto key = std::make_pair(getpid(), path);

  std::lock_guard<std::mutex> lock(mutex);
  auto it = writers.find(key);
  if (it != writers.end()) {
    *writer = it->second;
    return Status::OK();
  }

  auto opened = std::make_shared<JsonLogWriter>(path);
  TRACETREE_RETURN_NOT_OK(opened->Open());
  writers.emplace(key, opened);

  *writer = opened;
  return Status::OK();
}

}  // namespace tracetree
