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

#ifndef TRACETREE_UTILS_SPAN_ID_H_
#define TRACETREE_UTILS_SPAN_ID_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "common/status.h"

namespace tracetree {

constexpr size_t kSpanIdLength = 16;

// 16 byte span identifier. The first 8 bytes hold a big-endian nanosecond
// timestamp that never goes backwards within a process (and its forks), the
// last 8 bytes are random, so byte-wise order is creation order.
class SpanId {
 public:
  using Bytes = std::array<uint8_t, kSpanIdLength>;

  SpanId() { bytes_.fill(0); }
  explicit SpanId(const Bytes& bytes) : bytes_(bytes) {}

  // Generate a new id, greater than every id generated before by this process.
  static SpanId New();

  // Build from exactly kSpanIdLength raw bytes.
  static Status FromBytes(std::string_view raw, SpanId* id);

  // Inverse of ToString().
  static Status FromString(std::string_view str, SpanId* id);

  // URL-safe base64 without padding, always 22 characters.
  std::string ToString() const;

  std::string ToBytes() const {
    return std::string(reinterpret_cast<const char*>(bytes_.data()),
                       bytes_.size());
  }

  const Bytes& bytes() const { return bytes_; }

  uint64_t Timestamp() const;

  bool IsZero() const;

  bool operator==(const SpanId& rhs) const { return bytes_ == rhs.bytes_; }
  bool operator!=(const SpanId& rhs) const { return bytes_ != rhs.bytes_; }
  bool operator<(const SpanId& rhs) const { return bytes_ < rhs.bytes_; }
  bool operator>(const SpanId& rhs) const { return rhs < *this; }
  bool operator<=(const SpanId& rhs) const { return !(rhs < *this); }
  bool operator>=(const SpanId& rhs) const { return !(*this < rhs); }

 private:
  Bytes bytes_;
};

inline SpanId NewSpanId() { return SpanId::New(); }

}  // namespace tracetree

namespace std {

template <>
struct hash<tracetree::SpanId> {
  size_t operator()(const tracetree::SpanId& id) const noexcept {
    return std::hash<std::string>()(id.ToBytes());
  }
};

}  // namespace std

#endif  // TRACETREE_UTILS_SPAN_ID_H_
