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

#ifndef TRACETREE_TRACE_CONCURRENCY_TRACE_PROCESS_POOL_H_
#define TRACETREE_TRACE_CONCURRENCY_TRACE_PROCESS_POOL_H_

#include <json/json.h>
#include <sys/types.h>

#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "common/status.h"

namespace tracetree {

// Raised through the future of a failed submission: the task raised in the
// worker, the task is unknown, the request or the result exceeds
// --trace_max_frame_size, the worker died or the pool is stopped.
class ProcessTaskError : public std::runtime_error {
 public:
  explicit ProcessTaskError(const std::string& what)
      : std::runtime_error(what) {}
};

using ProcessTask = std::function<std::string(const std::string& arg)>;

// Pool of pre-forked worker processes. Tasks are registered by name before
// Start(), since the workers only know the tasks of the image they were
// forked from. Each submission carries a reference to the span that was
// current at submit time and the worker runs the task under it.
class TraceProcessPool {
 public:
  TraceProcessPool(const std::string& name, int num_workers);
  ~TraceProcessPool();

  TraceProcessPool(const TraceProcessPool&) = delete;
  TraceProcessPool& operator=(const TraceProcessPool&) = delete;

  // Exist for a duplicated name, Abort once started.
  Status RegisterTask(const std::string& name, ProcessTask task);

  Status Start();

  // Runs the queued submissions, then closes the workers and reaps them.
  Status Stop();

  std::future<std::string> Submit(const std::string& task_name,
                                  const std::string& arg);

  int AliveWorkers() const;

 private:
  struct Request {
    // encoded {task, arg, span_ref}
    std::string frame;
    std::promise<std::string> promise;
  };
  using RequestSPtr = std::shared_ptr<Request>;

  struct Worker {
    size_t index{0};
    pid_t pid{-1};
    int fd{-1};
    std::thread feeder;
  };

  // parent side, one per worker
  void FeederProc(Worker* worker);
  Status Call(Worker* worker, const Request& request, std::string* result,
              std::string* task_error);
  void FailQueuedRequests(const std::string& reason);

  // child side
  void WorkerLoop(int fd);
  std::string RunRequest(const std::string& frame);
  Json::Value HandleRequest(const std::string& frame);

  void ReapWorkers();

  const std::string name_;
  const int num_workers_;

  std::map<std::string, ProcessTask> tasks_;

  mutable std::mutex mutex_;
  std::condition_variable condition_;
  bool running_{false};
  int alive_workers_{0};
  std::queue<RequestSPtr> requests_;
  std::vector<std::unique_ptr<Worker>> workers_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_CONCURRENCY_TRACE_PROCESS_POOL_H_
