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

#include "trace/concurrency/trace_process.h"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <utility>

#include "common/logging.h"
#include "fmt/format.h"
#include "glog/logging.h"
#include "trace/constants.h"
#include "trace/span_ref.h"

extern char** environ;

namespace tracetree {

static const int kChildFailExitCode = 1;
static const int kExecFailExitCode = 127;

Status ResolveSpanRef(const std::string& ref_str, SpanSPtr* span) {
  SpanRef ref;
  TRACETREE_RETURN_NOT_OK(SpanRef::FromString(ref_str, &ref));
  return ResolveSpan(ref, span);
}

TraceProcess::TraceProcess(std::function<int()> fn)
    : method_(StartMethod::kFork), fn_(std::move(fn)) {}

TraceProcess::TraceProcess(const std::string& binary,
                           std::vector<std::string> args)
    : method_(StartMethod::kSpawn), binary_(binary), args_(std::move(args)) {}

TraceProcess::~TraceProcess() {
  if (pid_ > 0) {
    int exit_code = 0;
    Status s = Join(&exit_code);
    if (!s.ok()) {
      LOG(WARNING) << fmt::format("join child {} fail, status({}).", pid_,
                                  s.ToString());
    }
  }
}

Status TraceProcess::Start() {
  if (pid_ > 0) {
    return Status::Abort(fmt::format("child {} already started", pid_));
  }

  // capture in the parent, before the child exists
  std::string ref_str;
  SpanSPtr span = CurrentSpan();
  if (span != nullptr) {
    ref_str = span->Reference().ToString();
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    return Status::Internal(errno, "fork fail");
  }

  if (pid == 0) {
    if (method_ == StartMethod::kFork) {
      RunForkChild(ref_str);
    } else {
      ExecSpawnChild(ref_str);
    }
    // never reached
    ::_exit(kChildFailExitCode);
  }

  pid_ = pid;
  LOG(INFO) << fmt::format("started traced child pid({}) method({}).", pid_,
                           method_ == StartMethod::kFork ? "fork" : "spawn");
  return Status::OK();
}

void TraceProcess::RunForkChild(const std::string& ref_str) {
  // the copied slot still holds the parent's handle
  SpanSPtr span;
  if (!ref_str.empty()) {
    Status s = ResolveSpanRef(ref_str, &span);
    if (!s.ok()) {
      LOG(ERROR) << fmt::format("resolve inherited span fail, status({}).",
                                s.ToString());
      ::_exit(kChildFailExitCode);
    }
  }

  int exit_code = kChildFailExitCode;
  {
    SpanContextGuard guard(span);
    try {
      exit_code = fn_();
    } catch (const std::exception& e) {
      LOG(ERROR) << fmt::format("traced child pid({}) raised: {}", ::getpid(),
                                e.what());
      exit_code = kChildFailExitCode;
    } catch (...) {
      // must not unwind into the copy of the parent's stack
      LOG(ERROR) << fmt::format("traced child pid({}) raised unknown exception",
                                ::getpid());
      exit_code = kChildFailExitCode;
    }
  }

  google::FlushLogFiles(google::INFO);
  ::_exit(exit_code);
}

void TraceProcess::ExecSpawnChild(const std::string& ref_str) {
  std::vector<std::string> envs;
  std::string prefix = std::string(kSpanRefEnv) + "=";
  for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
    if (std::strncmp(*env, prefix.c_str(), prefix.size()) == 0) continue;
    envs.emplace_back(*env);
  }
  if (!ref_str.empty()) {
    envs.push_back(prefix + ref_str);
  }

  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& env : envs) envp.push_back(env.data());
  envp.push_back(nullptr);

  std::vector<std::string> argv_strs;
  argv_strs.reserve(args_.size() + 1);
  argv_strs.push_back(binary_);
  for (const auto& arg : args_) argv_strs.push_back(arg);

  std::vector<char*> argv;
  argv.reserve(argv_strs.size() + 1);
  for (auto& arg : argv_strs) argv.push_back(arg.data());
  argv.push_back(nullptr);

  ::execve(binary_.c_str(), argv.data(), envp.data());
  ::_exit(kExecFailExitCode);
}

Status TraceProcess::Join(int* exit_code) {
  if (pid_ <= 0) {
    return Status::Abort("child not started");
  }

  int wstatus = 0;
  pid_t ret = 0;
  do {
    ret = ::waitpid(pid_, &wstatus, 0);
  } while (ret < 0 && errno == EINTR);

  if (ret < 0) {
    return Status::Internal(errno, fmt::format("waitpid {} fail", pid_));
  }

  if (WIFEXITED(wstatus)) {
    *exit_code = WEXITSTATUS(wstatus);
  } else if (WIFSIGNALED(wstatus)) {
    *exit_code = 128 + WTERMSIG(wstatus);
  } else {
    *exit_code = -1;
  }

  LOG_DEBUG << fmt::format("child pid({}) exit code({}).", pid_, *exit_code);
  pid_ = -1;
  return Status::OK();
}

InheritedSpanScope::InheritedSpanScope() {
  const char* ref_str = std::getenv(kSpanRefEnv);
  if (ref_str == nullptr || ref_str[0] == '\0') {
    status_ = Status::NotFound(fmt::format("{} not set", kSpanRefEnv));
    return;
  }

  status_ = ResolveSpanRef(ref_str, &span_);
  if (!status_.ok()) {
    LOG(ERROR) << fmt::format("resolve inherited span fail, status({}).",
                              status_.ToString());
    return;
  }

  guard_ = std::make_unique<SpanContextGuard>(span_);
}

InheritedSpanScope::~InheritedSpanScope() { guard_.reset(); }

}  // namespace tracetree
