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

#include "utils/span_id.h"

#include <unistd.h>

#include <atomic>
#include <random>

#include "absl/strings/escaping.h"
#include "utils/time.h"

namespace tracetree {

static constexpr size_t kTimestampBytes = 8;
static constexpr size_t kSpanIdStrLength = 22;

// Shared by all threads, copied into a forked child together with the rest of
// the address space, so the child continues from the parent's last value.
static std::atomic<uint64_t> last_timestamp{0};

static uint64_t NextTimestamp() {
  uint64_t now = utils::TimestampNs();
  uint64_t last = last_timestamp.load(std::memory_order_relaxed);
  uint64_t next;
  do {
    next = (now > last) ? now : last + 1;
  } while (!last_timestamp.compare_exchange_weak(last, next,
                                                 std::memory_order_relaxed));
  return next;
}

static uint64_t NextRandom() {
  static thread_local std::mt19937_64 gen;
  static thread_local pid_t seeded_pid = 0;

  // reseed after fork, otherwise parent and child draw the same sequence
  pid_t pid = ::getpid();
  if (seeded_pid != pid) {
    std::random_device rd;
    gen.seed((static_cast<uint64_t>(rd()) << 32) ^ rd() ^
             static_cast<uint64_t>(pid));
    seeded_pid = pid;
  }

  return gen();
}

static void EncodeBigEndian(uint64_t value, uint8_t* out) {
  for (int i = kTimestampBytes - 1; i >= 0; --i) {
    out[i] = static_cast<uint8_t>(value & 0xFF);
    value >>= 8;
  }
}

SpanId SpanId::New() {
  Bytes bytes;
  EncodeBigEndian(NextTimestamp(), bytes.data());
  EncodeBigEndian(NextRandom(), bytes.data() + kTimestampBytes);
  return SpanId(bytes);
}

Status SpanId::FromBytes(std::string_view raw, SpanId* id) {
  if (raw.size() != kSpanIdLength) {
    return Status::InvalidParam(
        "invalid span id length: " + std::to_string(raw.size()));
  }

  Bytes bytes;
  for (size_t i = 0; i < kSpanIdLength; ++i) {
    bytes[i] = static_cast<uint8_t>(raw[i]);
  }
  *id = SpanId(bytes);
  return Status::OK();
}

Status SpanId::FromString(std::string_view str, SpanId* id) {
  if (str.size() != kSpanIdStrLength) {
    return Status::InvalidParam("invalid span id", str);
  }

  std::string raw;
  if (!absl::WebSafeBase64Unescape(absl::string_view(str.data(), str.size()),
                                   &raw)) {
    return Status::InvalidParam("span id is not url-safe base64", str);
  }

  return FromBytes(raw, id);
}

std::string SpanId::ToString() const {
  return absl::WebSafeBase64Escape(
      absl::string_view(reinterpret_cast<const char*>(bytes_.data()),
                        bytes_.size()));
}

uint64_t SpanId::Timestamp() const {
  uint64_t value = 0;
  for (size_t i = 0; i < kTimestampBytes; ++i) {
    value = (value << 8) | bytes_[i];
  }
  return value;
}

bool SpanId::IsZero() const {
  for (auto b : bytes_) {
    if (b != 0) return false;
  }
  return true;
}

}  // namespace tracetree
