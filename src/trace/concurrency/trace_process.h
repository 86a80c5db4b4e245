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

#ifndef TRACETREE_TRACE_CONCURRENCY_TRACE_PROCESS_H_
#define TRACETREE_TRACE_CONCURRENCY_TRACE_PROCESS_H_

#include <sys/types.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "common/status.h"
#include "trace/context.h"
#include "trace/span.h"

namespace tracetree {

enum class StartMethod : uint8_t {
  // fork() and run a function in the child
  kFork = 0,
  // fork() + exec a program, the reference travels in the environment
  kSpawn = 1,
};

// A child process whose work is traced under the span that was current in
// the parent when Start() was called. Only a SpanRef crosses the boundary,
// the child resolves it into its own handle.
//
// With kFork the child runs fn and exits with its return value. An
// exception escaping fn ends the child with exit code 1.
// With kSpawn the spawned program picks the span up with InheritedSpanScope.
class TraceProcess {
 public:
  explicit TraceProcess(std::function<int()> fn);
  TraceProcess(const std::string& binary, std::vector<std::string> args);

  // Waits for a child that was started and not joined.
  ~TraceProcess();

  TraceProcess(const TraceProcess&) = delete;
  TraceProcess& operator=(const TraceProcess&) = delete;

  Status Start();

  // Waits for the child. exit_code is 128 + signal when killed by a signal.
  Status Join(int* exit_code);

  pid_t Pid() const { return pid_; }

  StartMethod Method() const { return method_; }

 private:
  void RunForkChild(const std::string& ref_str);
  void ExecSpawnChild(const std::string& ref_str);

  StartMethod method_;
  std::function<int()> fn_;
  std::string binary_;
  std::vector<std::string> args_;

  pid_t pid_{-1};
};

// Resolve and install the span a parent passed through the environment
// (TRACETREE_SPAN_REF) for the lifetime of the scope. Without the variable
// the scope installs nothing and status() is NotFound.
class InheritedSpanScope {
 public:
  InheritedSpanScope();
  ~InheritedSpanScope();

  InheritedSpanScope(const InheritedSpanScope&) = delete;
  InheritedSpanScope& operator=(const InheritedSpanScope&) = delete;

  const Status& status() const { return status_; }

  SpanSPtr span() const { return span_; }

 private:
  Status status_;
  SpanSPtr span_;
  std::unique_ptr<SpanContextGuard> guard_;
};

// Resolve a serialized SpanRef into a live span.
Status ResolveSpanRef(const std::string& ref_str, SpanSPtr* span);

}  // namespace tracetree

#endif  // TRACETREE_TRACE_CONCURRENCY_TRACE_PROCESS_H_
