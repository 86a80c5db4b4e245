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

#ifndef TRACETREE_TRACE_CONCURRENCY_FRAME_IO_H_
#define TRACETREE_TRACE_CONCURRENCY_FRAME_IO_H_

#include <string>

#include "common/status.h"

namespace tracetree {

// Length prefixed frames over a stream socket: 4 byte big-endian length,
// then the payload. A frame holds at most --trace_max_frame_size bytes.

// InvalidParam for an oversized payload, nothing is sent then.
Status WriteFrame(int fd, const std::string& payload);

// Abort when the peer closed the socket before a new frame.
Status ReadFrame(int fd, std::string* payload);

}  // namespace tracetree

#endif  // TRACETREE_TRACE_CONCURRENCY_FRAME_IO_H_
