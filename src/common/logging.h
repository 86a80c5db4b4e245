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

#ifndef TRACETREE_COMMON_LOGGING_H_
#define TRACETREE_COMMON_LOGGING_H_

#include <gflags/gflags_declare.h>

#include <cstdint>
#include <string>

#include "glog/logging.h"

namespace tracetree {

DECLARE_string(trace_log_dir);
DECLARE_string(trace_log_level);
DECLARE_int32(trace_log_v);

enum class LogLevel : uint8_t {
  kDEBUG = 0,
  kINFO = 1,
  kWARNING = 2,
  kERROR = 3,
  kFATAL = 4
};

// define the debug log level.
// The larger the number, the more comprehensive information is displayed.
#define TRACETREE_DEBUG 79

#define LOG_DEBUG VLOG(TRACETREE_DEBUG)

#define LOG_IF_DEBUG(condition) VLOG_IF(TRACETREE_DEBUG, condition)

class Logger {
 public:
  // Log files are written to FLAGS_trace_log_dir as <role>.<level>.log.*
  static void Init(const std::string& role);

  static void SetMinLogLevel(int level);
  static int GetMinLogLevel();

  static void SetMinVerboseLevel(int v);
  static int GetMinVerboseLevel();

  static void ChangeGlogLevel(const std::string& level);
  static void ChangeGlogLevel(LogLevel level, uint32_t verbose);
};

}  // namespace tracetree

#endif  // TRACETREE_COMMON_LOGGING_H_
