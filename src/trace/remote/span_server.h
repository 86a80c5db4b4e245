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

#ifndef TRACETREE_TRACE_REMOTE_SPAN_SERVER_H_
#define TRACETREE_TRACE_REMOTE_SPAN_SERVER_H_

#include <brpc/server.h>

#include <atomic>
#include <memory>
#include <string>

#include "common/status.h"
#include "trace/remote/span_service.h"
#include "trace/sqlite/span_db.h"

namespace tracetree {
namespace remote {

// brpc server hosting the span service over one sqlite database.
class SpanServer {
 public:
  explicit SpanServer(const std::string& db_path);

  // Start serving and return.
  Status Start(const std::string& listen_ip, uint32_t listen_port);

  // Block until SIGINT/SIGTERM or brpc::AskToQuit().
  void RunUntilAskedToQuit();

  // Stop serving and checkpoint the database.
  Status Shutdown();

  int ListenPort() const;

 private:
  std::atomic<bool> running_;
  SpanDatabaseSPtr db_;
  std::unique_ptr<SpanServiceImpl> service_;
  std::unique_ptr<brpc::Server> server_;
};

}  // namespace remote
}  // namespace tracetree

#endif  // TRACETREE_TRACE_REMOTE_SPAN_SERVER_H_
