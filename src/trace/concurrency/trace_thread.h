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

#ifndef TRACETREE_TRACE_CONCURRENCY_TRACE_THREAD_H_
#define TRACETREE_TRACE_CONCURRENCY_TRACE_THREAD_H_

#include <functional>
#include <thread>
#include <utility>

#include "trace/context.h"

namespace tracetree {

// std::thread that runs its body under the span that was current when the
// thread was created. The same span handle is shared with the creator.
// Joins on destruction.
class TraceThread {
 public:
  TraceThread() = default;

  template <class F, class... Args>
  explicit TraceThread(F&& fn, Args&&... args)
      : thread_([span = CurrentSpan(),
                 body = std::bind(std::forward<F>(fn),
                                  std::forward<Args>(args)...)]() mutable {
          SpanContextGuard guard(span);
          body();
        }) {}

  ~TraceThread() { Join(); }

  TraceThread(TraceThread&&) = default;
  TraceThread& operator=(TraceThread&& other) {
    Join();
    thread_ = std::move(other.thread_);
    return *this;
  }

  bool Joinable() const { return thread_.joinable(); }

  void Join() {
    if (thread_.joinable()) thread_.join();
  }

  std::thread::id Id() const { return thread_.get_id(); }

 private:
  std::thread thread_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_CONCURRENCY_TRACE_THREAD_H_
