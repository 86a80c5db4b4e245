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

#include "common/logging.h"

#include <gflags/gflags.h>
#include <sys/stat.h>

#include <cerrno>

#include "fmt/core.h"

namespace tracetree {

DEFINE_string(trace_log_dir, "./log", "directory of the glog log files");
DEFINE_string(trace_log_level, "INFO",
              "log level (DEBUG|INFO|WARNING|ERROR|FATAL)");
DEFINE_int32(trace_log_v, 0, "verbose level used when log level is DEBUG");

static void CreateLogDir(const std::string& log_dir) {
  std::string path;
  for (size_t pos = 0; pos != std::string::npos;) {
    pos = log_dir.find('/', pos + 1);
    path = log_dir.substr(0, pos);
    if (path.empty()) {
      continue;
    }
    if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
      LOG(WARNING) << "Create log directory failed: path = " << path
                   << ", errno = " << errno;
      return;
    }
  }
}

void Logger::Init(const std::string& role) {
  CreateLogDir(FLAGS_trace_log_dir);

  FLAGS_logbufsecs = 0;
  FLAGS_max_log_size = 256;
  FLAGS_stop_logging_if_full_disk = true;
  FLAGS_minloglevel = google::GLOG_INFO;
  FLAGS_logbuflevel = google::GLOG_INFO;
  FLAGS_logtostdout = false;
  FLAGS_logtostderr = false;
  ChangeGlogLevel(FLAGS_trace_log_level);

  google::InitGoogleLogging(role.c_str());
  google::SetLogDestination(
      google::GLOG_INFO,
      fmt::format("{}/{}.info.log.", FLAGS_trace_log_dir, role).c_str());
  google::SetLogDestination(
      google::GLOG_WARNING,
      fmt::format("{}/{}.warn.log.", FLAGS_trace_log_dir, role).c_str());
  google::SetLogDestination(
      google::GLOG_ERROR,
      fmt::format("{}/{}.error.log.", FLAGS_trace_log_dir, role).c_str());
  google::SetLogDestination(
      google::GLOG_FATAL,
      fmt::format("{}/{}.fatal.log.", FLAGS_trace_log_dir, role).c_str());
  google::SetStderrLogging(google::GLOG_ERROR);
}

void Logger::SetMinLogLevel(int level) { FLAGS_minloglevel = level; }

int Logger::GetMinLogLevel() { return FLAGS_minloglevel; }

void Logger::SetMinVerboseLevel(int v) { FLAGS_v = v; }

int Logger::GetMinVerboseLevel() { return FLAGS_v; }

void Logger::ChangeGlogLevel(const std::string& level) {
  if (level == "DEBUG") {
    ChangeGlogLevel(LogLevel::kDEBUG, FLAGS_trace_log_v);
  } else if (level == "WARNING") {
    ChangeGlogLevel(LogLevel::kWARNING, 0);
  } else if (level == "ERROR") {
    ChangeGlogLevel(LogLevel::kERROR, 0);
  } else if (level == "FATAL") {
    ChangeGlogLevel(LogLevel::kFATAL, 0);
  } else {
    ChangeGlogLevel(LogLevel::kINFO, 0);
  }
}

void Logger::ChangeGlogLevel(LogLevel level, uint32_t verbose) {
  if (level == LogLevel::kDEBUG) {
    SetMinLogLevel(google::GLOG_INFO);
    SetMinVerboseLevel(verbose == 0 ? TRACETREE_DEBUG : verbose);
  } else {
    SetMinLogLevel(static_cast<int>(level) - 1);
    SetMinVerboseLevel(1);
  }
}

}  // namespace tracetree
