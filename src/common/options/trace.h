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

#ifndef TRACETREE_COMMON_OPTIONS_TRACE_H_
#define TRACETREE_COMMON_OPTIONS_TRACE_H_

#include <gflags/gflags_declare.h>

namespace tracetree {

// ###############################################
// # span
// ###############################################

// Name of the root span created by a tracing (default is "root").
DECLARE_string(trace_root_name);

// Name given to a child span when the caller passes an empty name.
DECLARE_string(trace_default_span_name);

// ###############################################
// # sqlite
// ###############################################

// How long (ms) a connection waits on a locked database before giving up.
DECLARE_int32(trace_sqlite_busy_timeout_ms);

// ###############################################
// # remote
// ###############################################

// Timeout (ms) for every span rpc request.
DECLARE_int32(trace_rpc_timeout_ms);

// Max time (ms) to wait for a span server to become ready.
DECLARE_int32(trace_server_ready_timeout_ms);

// Interval (ms) between two readiness probes.
DECLARE_int32(trace_server_ready_poll_ms);

// Path of the tracetree-server executable started by RemoteTracing.
DECLARE_string(trace_server_binary);

// Address the started span server listens on.
DECLARE_string(trace_server_listen_ip);

// ###############################################
// # process pool
// ###############################################

// Max size (bytes) of one request or reply frame between a process pool
// and its workers.
DECLARE_int32(trace_max_frame_size);

}  // namespace tracetree

#endif  // TRACETREE_COMMON_OPTIONS_TRACE_H_
