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

#ifndef TRACETREE_UTILS_TIME_H_
#define TRACETREE_UTILS_TIME_H_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace tracetree {
namespace utils {

inline uint64_t TimestampNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline uint64_t TimestampMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline std::string FormatTime(int64_t timestamp, const std::string& format) {
  std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds> tp(
      (std::chrono::seconds(timestamp)));

  auto in_time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf;
  localtime_r(&in_time_t, &tm_buf);
  std::stringstream ss;
  ss << std::put_time(&tm_buf, format.c_str());
  return ss.str();
}

// e.g. "2024-03-05 12:30:01", the format used for span start/end time
inline std::string GetNowFormatTime() {
  return FormatTime(TimestampMs() / 1000, "%Y-%m-%d %H:%M:%S");
}

}  // namespace utils
}  // namespace tracetree

#endif  // TRACETREE_UTILS_TIME_H_
