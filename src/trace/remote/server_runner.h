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

#ifndef TRACETREE_TRACE_REMOTE_SERVER_RUNNER_H_
#define TRACETREE_TRACE_REMOTE_SERVER_RUNNER_H_

#include <sys/types.h>

#include <string>

#include "common/status.h"

namespace tracetree {
namespace remote {

// Runs a tracetree-server as a child process on a free local port.
class ServerProcessRunner {
 public:
  ServerProcessRunner(const std::string& binary, const std::string& db_path);
  ~ServerProcessRunner();

  ServerProcessRunner(const ServerProcessRunner&) = delete;
  ServerProcessRunner& operator=(const ServerProcessRunner&) = delete;

  // Start the server and wait until it answers the readiness probe.
  Status Start();

  // SIGTERM the server and reap it.
  Status Stop();

  bool IsRunning() const { return pid_ > 0; }

  const std::string& Url() const { return url_; }

 private:
  const std::string binary_;
  const std::string db_path_;
  std::string url_;
  pid_t pid_{-1};
};

// Ask the kernel for a port nobody listens on.
Status PickFreePort(const std::string& ip, int* port);

}  // namespace remote
}  // namespace tracetree

#endif  // TRACETREE_TRACE_REMOTE_SERVER_RUNNER_H_
