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

#include "trace/remote/span_server.h"

#include <csignal>

#include "common/logging.h"

namespace brpc {
DECLARE_bool(graceful_quit_on_sigterm);
}  // namespace brpc

namespace tracetree {
namespace remote {

SpanServer::SpanServer(const std::string& db_path)
    : running_(false),
      db_(std::make_shared<SpanDatabase>(db_path)),
      service_(std::make_unique<SpanServiceImpl>(db_)),
      server_(std::make_unique<brpc::Server>()) {}

Status SpanServer::Start(const std::string& listen_ip, uint32_t listen_port) {
  if (running_) {
    return Status::OK();
  }

  LOG(INFO) << "Span server is starting...";

  CHECK(SIG_ERR != signal(SIGPIPE, SIG_IGN));

  auto status = db_->Init();
  if (!status.ok()) {
    LOG(ERROR) << "Init span database failed: " << status.ToString();
    return status;
  }

  butil::EndPoint ep;
  int rc = butil::str2endpoint(listen_ip.c_str(), listen_port, &ep);
  if (rc != 0) {
    LOG(ERROR) << "str2endpoint(" << listen_ip << "," << listen_port
               << ") failed: rc = " << rc;
    return Status::InvalidParam("str2endpoint() failed");
  }

  status = AddSpanService(server_.get(), service_.get());
  if (!status.ok()) {
    return status;
  }

  brpc::ServerOptions options;
  rc = server_->Start(ep, &options);
  if (rc != 0) {
    LOG(ERROR) << "Start brpc server failed: rc = " << rc;
    return Status::Internal("start server failed");
  }

  running_ = true;

  LOG(INFO) << "Span server is up: address = " << listen_ip << ":"
            << ListenPort() << ", db = " << db_->Path();

  return Status::OK();
}

void SpanServer::RunUntilAskedToQuit() {
  brpc::FLAGS_graceful_quit_on_sigterm = true;
  server_->RunUntilAskedToQuit();
}

Status SpanServer::Shutdown() {
  if (!running_.exchange(false)) {
    return Status::OK();
  }

  LOG(INFO) << "Span server is shutting down...";

  server_->Stop(0);
  server_->Join();

  auto status = db_->WalCheckpoint();
  if (!status.ok()) {
    LOG(ERROR) << "Checkpoint span database failed: " << status.ToString();
    return status;
  }

  LOG(INFO) << "Span server is down.";
  return Status::OK();
}

int SpanServer::ListenPort() const { return server_->listen_address().port; }

}  // namespace remote
}  // namespace tracetree
