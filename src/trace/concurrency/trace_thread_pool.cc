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

#include "trace/concurrency/trace_thread_pool.h"

#include <pthread.h>

#include "common/logging.h"
#include "fmt/format.h"
#include "glog/logging.h"

namespace tracetree {

TraceThreadPool::TraceThreadPool(const std::string& name, int num_threads)
    : name_(name), num_threads_(num_threads) {
  CHECK(num_threads_ > 0) << "thread pool needs at least one thread.";
}

TraceThreadPool::~TraceThreadPool() { Stop(); }

void TraceThreadPool::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }

  running_ = true;
  threads_.reserve(num_threads_);
  for (int i = 0; i < num_threads_; ++i) {
    threads_.emplace_back([this, i] { ThreadProc(i); });
  }
}

void TraceThreadPool::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }

    running_ = false;
    condition_.notify_all();
  }

  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();

  LOG_DEBUG << fmt::format("thread pool({}) stopped.", name_);
}

int TraceThreadPool::GetTaskNum() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

bool TraceThreadPool::Enqueue(SpanSPtr span, std::function<void()> fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_) {
    LOG(WARNING) << fmt::format("thread pool({}) not running, refuse task.",
                                name_);
    return false;
  }

  jobs_.push(Job{std::move(span), std::move(fn)});
  condition_.notify_one();
  return true;
}

void TraceThreadPool::ThreadProc(size_t thread_id) {
  LOG_DEBUG << "Thread " << name_ << ":" << thread_id << " started.";

  pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());

  while (true) {
    Job job;

    {
      std::unique_lock<std::mutex> lock(mutex_);
      condition_.wait(lock, [this] { return !jobs_.empty() || !running_; });

      // queued jobs still run after Stop()
      if (!running_ && jobs_.empty()) {
        break;
      }

      job = std::move(jobs_.front());
      jobs_.pop();
    }  // end lock scope

    SpanContextGuard guard(job.span);
    job.fn();
  }  // end of while loop

  LOG_DEBUG << "Thread " << name_ << ":" << thread_id << " exit.";
}

}  // namespace tracetree
