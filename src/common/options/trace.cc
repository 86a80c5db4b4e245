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

#include "common/options/trace.h"

#include <gflags/gflags.h>

namespace tracetree {

#ifndef TRACETREE_SERVER_BINARY
#define TRACETREE_SERVER_BINARY "tracetree-server"
#endif

DEFINE_string(trace_root_name, "root", "name of the root span");
DEFINE_string(trace_default_span_name, "no-name",
              "span name used when none is given");

DEFINE_int32(trace_sqlite_busy_timeout_ms, 5000,
             "sqlite busy timeout in milliseconds");
DEFINE_validator(trace_sqlite_busy_timeout_ms,
                 [](const char* /*name*/, int32_t value) { return value >= 0; });

DEFINE_int32(trace_rpc_timeout_ms, 3000, "span rpc timeout in milliseconds");
DEFINE_int32(trace_server_ready_timeout_ms, 30000,
             "max wait for the span server to become ready");
DEFINE_int32(trace_server_ready_poll_ms, 100,
             "interval between two readiness probes");
DEFINE_validator(trace_server_ready_poll_ms,
                 [](const char* /*name*/, int32_t value) { return value > 0; });

DEFINE_string(trace_server_binary, TRACETREE_SERVER_BINARY,
              "path of the tracetree-server executable");
DEFINE_string(trace_server_listen_ip, "127.0.0.1",
              "listen ip of a span server started by a remote tracing");

DEFINE_int32(trace_max_frame_size, 64 * 1024 * 1024,
             "max size of a process pool request or reply frame");
DEFINE_validator(trace_max_frame_size,
                 [](const char* /*name*/, int32_t value) { return value > 0; });

}  // namespace tracetree
