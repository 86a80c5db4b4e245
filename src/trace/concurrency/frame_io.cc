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

#include "trace/concurrency/frame_io.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>

#include "common/options/trace.h"
#include "fmt/format.h"

namespace tracetree {

static Status WriteAll(int fd, const char* data, size_t size) {
  while (size > 0) {
    ssize_t n = ::send(fd, data, size, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return Status::IoError(errno, "send frame fail");
    }
    data += n;
    size -= n;
  }
  return Status::OK();
}

// Sets *eof when the peer closed before the first byte.
static Status ReadAll(int fd, char* data, size_t size, bool* eof) {
  size_t done = 0;
  *eof = false;
  while (done < size) {
    ssize_t n = ::read(fd, data + done, size - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      return Status::IoError(errno, "read frame fail");
    }
    if (n == 0) {
      if (done == 0) {
        *eof = true;
        return Status::OK();
      }
      return Status::IoError("frame truncated");
    }
    done += n;
  }
  return Status::OK();
}

Status WriteFrame(int fd, const std::string& payload) {
  if (payload.size() > static_cast<size_t>(FLAGS_trace_max_frame_size)) {
    return Status::InvalidParam(
        fmt::format("frame too large: {}", payload.size()));
  }

  uint32_t size = payload.size();
  char header[4] = {
      static_cast<char>((size >> 24) & 0xFF),
      static_cast<char>((size >> 16) & 0xFF),
      static_cast<char>((size >> 8) & 0xFF),
      static_cast<char>(size & 0xFF),
  };

  TRACETREE_RETURN_NOT_OK(WriteAll(fd, header, sizeof(header)));
  return WriteAll(fd, payload.data(), payload.size());
}

Status ReadFrame(int fd, std::string* payload) {
  unsigned char header[4];
  bool eof = false;
  TRACETREE_RETURN_NOT_OK(
      ReadAll(fd, reinterpret_cast<char*>(header), sizeof(header), &eof));
  if (eof) {
    return Status::Abort("peer closed");
  }

  uint32_t size = (static_cast<uint32_t>(header[0]) << 24) |
                  (static_cast<uint32_t>(header[1]) << 16) |
                  (static_cast<uint32_t>(header[2]) << 8) |
                  static_cast<uint32_t>(header[3]);
  if (size > static_cast<uint32_t>(FLAGS_trace_max_frame_size)) {
    return Status::IoError(fmt::format("bad frame size: {}", size));
  }

  payload->resize(size);
  if (size == 0) return Status::OK();

  TRACETREE_RETURN_NOT_OK(ReadAll(fd, payload->data(), size, &eof));
  if (eof) {
    return Status::IoError("frame truncated");
  }
  return Status::OK();
}

}  // namespace tracetree
