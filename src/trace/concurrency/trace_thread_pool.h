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

#ifndef TRACETREE_TRACE_CONCURRENCY_TRACE_THREAD_POOL_H_
#define TRACETREE_TRACE_CONCURRENCY_TRACE_THREAD_POOL_H_

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "trace/context.h"
#include "trace/span.h"

namespace tracetree {

// Raised through the future of a task submitted before Start() or after
// Stop().
class ThreadPoolStoppedError : public std::runtime_error {
 public:
  explicit ThreadPoolStoppedError(const std::string& what)
      : std::runtime_error(what) {}
};

// Thread pool whose tasks run under the span that was current when they
// were submitted, not when they run. Workers get their previous (empty)
// span back after every task.
class TraceThreadPool {
 public:
  TraceThreadPool(const std::string& name, int num_threads);
  ~TraceThreadPool();

  TraceThreadPool(const TraceThreadPool&) = delete;
  TraceThreadPool& operator=(const TraceThreadPool&) = delete;

  void Start();

  // Runs the queued tasks, then joins the workers.
  void Stop();

  // The future carries the result or the exception of fn, or
  // ThreadPoolStoppedError when the pool is not running.
  template <class F>
  auto Submit(F&& fn) -> std::future<decltype(fn())> {
    using R = decltype(fn());

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    std::future<R> future = task->get_future();
    if (!Enqueue(CurrentSpan(), [task]() { (*task)(); })) {
      std::promise<R> refused;
      refused.set_exception(std::make_exception_ptr(ThreadPoolStoppedError(
          "thread pool " + name_ + " not running")));
      return refused.get_future();
    }
    return future;
  }

  // Number of tasks waiting for a worker.
  int GetTaskNum() const;

 private:
  struct Job {
    SpanSPtr span;
    std::function<void()> fn;
  };

  // false when the pool is not running, the job is dropped then
  bool Enqueue(SpanSPtr span, std::function<void()> fn);

  void ThreadProc(size_t thread_id);

  const std::string name_;
  const int num_threads_;

  mutable std::mutex mutex_;
  std::condition_variable condition_;
  bool running_{false};
  std::vector<std::thread> threads_;
  std::queue<Job> jobs_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_CONCURRENCY_TRACE_THREAD_POOL_H_
