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

#include "trace/remote/server_runner.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

#include "common/logging.h"
#include "common/options/trace.h"
#include "fmt/format.h"
#include "trace/remote/span_client.h"

namespace tracetree {
namespace remote {

static constexpr int kStopWaitMs = 10000;
static constexpr int kStopPollMs = 20;

Status PickFreePort(const std::string& ip, int* port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return Status::IoError(errno, "create socket fail");
  }

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
    ::close(fd);
    return Status::InvalidParam("invalid listen ip", ip);
  }

  if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) !=
      0) {
    int err = errno;
    ::close(fd);
    return Status::IoError(err, "bind socket fail");
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) !=
      0) {
    int err = errno;
    ::close(fd);
    return Status::IoError(err, "getsockname fail");
  }

  *port = ntohs(addr.sin_port);
  ::close(fd);
  return Status::OK();
}

ServerProcessRunner::ServerProcessRunner(const std::string& binary,
                                         const std::string& db_path)
    : binary_(binary), db_path_(db_path) {}

ServerProcessRunner::~ServerProcessRunner() {
  Status s = Stop();
  LOG_IF(ERROR, !s.ok()) << "stop span server fail: " << s.ToString();
}

Status ServerProcessRunner::Start() {
  if (IsRunning()) return Status::OK();

  const std::string& ip = FLAGS_trace_server_listen_ip;
  int port = 0;
  TRACETREE_RETURN_NOT_OK(PickFreePort(ip, &port));

  std::vector<std::string> args = {
      binary_,
      fmt::format("--port={}", port),
      fmt::format("--db_path={}", db_path_),
      fmt::format("--trace_server_listen_ip={}", ip),
      fmt::format("--trace_log_dir={}", FLAGS_trace_log_dir),
  };
  // argv must be ready before fork, the child only calls execv
  std::vector<char*> argv;
  for (auto& arg : args) argv.push_back(arg.data());
  argv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    return Status::Internal(errno, "fork span server fail");
  }
  if (pid == 0) {
    ::execv(argv[0], argv.data());
    ::_exit(127);
  }

  pid_ = pid;
  url_ = fmt::format("http://{}:{}", ip, port);
  LOG(INFO) << "span server started, pid: " << pid_ << ", url: " << url_
            << ", db: " << db_path_;

  SpanClient client(url_);
  Status s = client.Init();
  if (s.ok()) {
    s = client.WaitForReady(FLAGS_trace_server_ready_timeout_ms,
                            FLAGS_trace_server_ready_poll_ms);
  }
  if (!s.ok()) {
    LOG(ERROR) << "span server not ready: " << s.ToString();
    Status stop = Stop();
    LOG_IF(ERROR, !stop.ok()) << "stop span server fail: " << stop.ToString();
    return s;
  }

  return Status::OK();
}

Status ServerProcessRunner::Stop() {
  if (!IsRunning()) return Status::OK();

  pid_t pid = pid_;
  pid_ = -1;

  if (::kill(pid, SIGTERM) != 0 && errno != ESRCH) {
    return Status::Internal(errno, "kill span server fail");
  }

  int wstatus = 0;
  int waited_ms = 0;
  while (true) {
    pid_t rc = ::waitpid(pid, &wstatus, WNOHANG);
    if (rc == pid) break;
    if (rc < 0) {
      return Status::Internal(errno, "waitpid span server fail");
    }

    if (waited_ms >= kStopWaitMs) {
      LOG(WARNING) << "span server " << pid << " ignores SIGTERM, kill it.";
      ::kill(pid, SIGKILL);
      if (::waitpid(pid, &wstatus, 0) < 0) {
        return Status::Internal(errno, "waitpid span server fail");
      }
      break;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(kStopPollMs));
    waited_ms += kStopPollMs;
  }

  int exit_code = WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : -1;
  LOG(INFO) << "span server stopped, pid: " << pid
            << ", exit code: " << exit_code;
  return Status::OK();
}

}  // namespace remote
}  // namespace tracetree
