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

#ifndef TRACETREE_TRACE_TRACING_H_
#define TRACETREE_TRACE_TRACING_H_

#include <cstdint>
#include <memory>

#include "common/status.h"
#include "trace/span.h"

namespace tracetree {

// Owns the root span of one trace. Entering makes the root the current span
// of the calling thread, exiting restores whatever was current before.
//
// inactive --Enter()--> active --Exit()--> exited
//
// A tracing can only be entered once, Enter() and Exit() must run on the same
// thread.
class Tracing {
 public:
  Tracing() = default;
  virtual ~Tracing();

  Tracing(const Tracing&) = delete;
  Tracing& operator=(const Tracing&) = delete;

  // nullptr until the root exists, see the backend for when that is.
  virtual SpanSPtr RootSpan() const = 0;

  virtual Status GetTree(TreeSPtr* tree) const = 0;

  // Abort when already entered or exited.
  Status Enter();

  // No-op when not active.
  Status Exit();

  bool IsActive() const { return state_ == State::kActive; }

 protected:
  // Called by Enter() before the root is installed, acquire transient
  // resources and make sure RootSpan() is set.
  virtual Status OnEnter() { return Status::OK(); }

  // Called by Exit() after the root is closed and the slot restored.
  virtual void OnExit() {}

 private:
  enum class State : uint8_t {
    kInactive = 0,
    kActive = 1,
    kExited = 2,
  };

  State state_{State::kInactive};
  SpanSPtr prev_span_;
};

using TracingUPtr = std::unique_ptr<Tracing>;

// Enter a tracing for the lifetime of the scope.
class TracingScope {
 public:
  explicit TracingScope(Tracing* tracing);
  ~TracingScope();

  TracingScope(const TracingScope&) = delete;
  TracingScope& operator=(const TracingScope&) = delete;

  const Status& status() const { return status_; }

 private:
  Tracing* tracing_;
  Status status_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_TRACING_H_
