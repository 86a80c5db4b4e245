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

#include "trace/concurrency/trace_process_pool.h"

#include <json/json.h>
#include <pthread.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <exception>
#include <utility>

#include "common/logging.h"
#include "common/options/trace.h"
#include "fmt/format.h"
#include "glog/logging.h"
#include "trace/concurrency/frame_io.h"
#include "trace/concurrency/trace_process.h"
#include "trace/context.h"
#include "utils/json_util.h"

namespace tracetree {

static const char* const kTaskKey = "task";
static const char* const kArgKey = "arg";
static const char* const kSpanRefKey = "span_ref";
static const char* const kOkKey = "ok";
static const char* const kResultKey = "result";
static const char* const kErrorKey = "error";

static std::exception_ptr MakeTaskError(const std::string& what) {
  return std::make_exception_ptr(ProcessTaskError(what));
}

static bool ExceedFrameSize(const std::string& frame) {
  return frame.size() > static_cast<size_t>(FLAGS_trace_max_frame_size);
}

// the socket is unusable after these, a task level failure leaves it in sync
static bool IsTransportError(const Status& s) {
  return s.IsIoError() || s.IsAbort();
}

TraceProcessPool::TraceProcessPool(const std::string& name, int num_workers)
    : name_(name), num_workers_(num_workers) {
  CHECK(num_workers_ > 0) << "process pool needs at least one worker.";
}

TraceProcessPool::~TraceProcessPool() {
  Status s = Stop();
  if (!s.ok()) {
    LOG(WARNING) << fmt::format("stop process pool({}) fail, status({}).",
                                name_, s.ToString());
  }
}

Status TraceProcessPool::RegisterTask(const std::string& name,
                                      ProcessTask task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_ || !workers_.empty()) {
    return Status::Abort("process pool already started");
  }
  if (!tasks_.emplace(name, std::move(task)).second) {
    return Status::Exist(fmt::format("task {} already registered", name));
  }
  return Status::OK();
}

Status TraceProcessPool::Start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return Status::OK();
  }

  // fork all workers before any feeder thread exists
  std::vector<std::unique_ptr<Worker>> workers;
  for (int i = 0; i < num_workers_; ++i) {
    int sv[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
      Status s = Status::Internal(errno, "socketpair fail");
      workers_ = std::move(workers);
      ReapWorkers();
      return s;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
      Status s = Status::Internal(errno, "fork worker fail");
      ::close(sv[0]);
      ::close(sv[1]);
      workers_ = std::move(workers);
      ReapWorkers();
      return s;
    }

    if (pid == 0) {
      ::close(sv[0]);
      // siblings must see EOF when the parent closes their socket
      for (auto& worker : workers) ::close(worker->fd);
      WorkerLoop(sv[1]);
      ::_exit(0);
    }

    ::close(sv[1]);
    auto worker = std::make_unique<Worker>();
    worker->index = i;
    worker->pid = pid;
    worker->fd = sv[0];
    workers.push_back(std::move(worker));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  workers_ = std::move(workers);
  running_ = true;
  alive_workers_ = workers_.size();
  for (auto& worker : workers_) {
    Worker* w = worker.get();
    w->feeder = std::thread([this, w] { FeederProc(w); });
  }

  LOG(INFO) << fmt::format("process pool({}) started {} workers.", name_,
                           workers_.size());
  return Status::OK();
}

Status TraceProcessPool::Stop() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_) {
      return Status::OK();
    }

    running_ = false;
    condition_.notify_all();
  }

  for (auto& worker : workers_) {
    if (worker->feeder.joinable()) {
      worker->feeder.join();
    }
  }

  ReapWorkers();

  std::lock_guard<std::mutex> lock(mutex_);
  alive_workers_ = 0;
  LOG(INFO) << fmt::format("process pool({}) stopped.", name_);
  return Status::OK();
}

void TraceProcessPool::ReapWorkers() {
  for (auto& worker : workers_) {
    if (worker->fd >= 0) {
      ::close(worker->fd);
      worker->fd = -1;
    }

    int wstatus = 0;
    pid_t ret = 0;
    do {
      ret = ::waitpid(worker->pid, &wstatus, 0);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
      LOG(WARNING) << fmt::format("waitpid worker({}) fail, errno({}).",
                                  worker->pid, errno);
    } else if (!WIFEXITED(wstatus) || WEXITSTATUS(wstatus) != 0) {
      LOG(WARNING) << fmt::format("worker({}) exited abnormally, wstatus({}).",
                                  worker->pid, wstatus);
    }
  }
  workers_.clear();
}

int TraceProcessPool::AliveWorkers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return alive_workers_;
}

std::future<std::string> TraceProcessPool::Submit(const std::string& task_name,
                                                  const std::string& arg) {
  Json::Value frame(Json::objectValue);
  frame[kTaskKey] = task_name;
  frame[kArgKey] = arg;
  SpanSPtr span = CurrentSpan();
  if (span != nullptr) {
    frame[kSpanRefKey] = span->Reference().ToString();
  }

  auto request = std::make_shared<Request>();
  request->frame = utils::JsonToString(frame);

  std::future<std::string> future = request->promise.get_future();

  std::lock_guard<std::mutex> lock(mutex_);
  if (tasks_.find(task_name) == tasks_.end()) {
    request->promise.set_exception(
        MakeTaskError(fmt::format("unknown task: {}", task_name)));
  } else if (ExceedFrameSize(request->frame)) {
    request->promise.set_exception(MakeTaskError(
        fmt::format("request too large: {} bytes", request->frame.size())));
  } else if (!running_ || alive_workers_ == 0) {
    request->promise.set_exception(
        MakeTaskError(fmt::format("process pool {} not running", name_)));
  } else {
    requests_.push(std::move(request));
    condition_.notify_one();
  }

  return future;
}

void TraceProcessPool::FeederProc(Worker* worker) {
  LOG_DEBUG << "Feeder " << name_ << ":" << worker->index << " started.";

  std::string thread_name = fmt::format("{}-{}", name_, worker->index);
  pthread_setname_np(pthread_self(), thread_name.substr(0, 15).c_str());

  while (true) {
    RequestSPtr request;

    {
      std::unique_lock<std::mutex> lock(mutex_);
      condition_.wait(lock,
                      [this] { return !requests_.empty() || !running_; });

      if (!running_ && requests_.empty()) {
        break;
      }

      request = std::move(requests_.front());
      requests_.pop();
    }  // end lock scope

    std::string result;
    std::string task_error;
    Status s = Call(worker, *request, &result, &task_error);
    if (!s.ok() && !IsTransportError(s)) {
      LOG(WARNING) << fmt::format(
          "call worker({}) of pool({}) fail, status({}).", worker->pid, name_,
          s.ToString());
      request->promise.set_exception(MakeTaskError(s.ToString()));
      continue;
    }

    if (!s.ok()) {
      LOG(ERROR) << fmt::format("worker({}) of pool({}) lost, status({}).",
                                worker->pid, name_, s.ToString());
      request->promise.set_exception(MakeTaskError(
          fmt::format("worker {} lost: {}", worker->pid, s.ToString())));

      std::lock_guard<std::mutex> lock(mutex_);
      if (--alive_workers_ == 0) {
        FailQueuedRequests("all workers lost");
      }
      break;
    }

    if (task_error.empty()) {
      request->promise.set_value(std::move(result));
    } else {
      request->promise.set_exception(MakeTaskError(task_error));
    }
  }  // end of while loop

  LOG_DEBUG << "Feeder " << name_ << ":" << worker->index << " exit.";
}

// mutex_ held
void TraceProcessPool::FailQueuedRequests(const std::string& reason) {
  while (!requests_.empty()) {
    requests_.front()->promise.set_exception(MakeTaskError(reason));
    requests_.pop();
  }
}

Status TraceProcessPool::Call(Worker* worker, const Request& request,
                              std::string* result, std::string* task_error) {
  TRACETREE_RETURN_NOT_OK(WriteFrame(worker->fd, request.frame));

  std::string reply;
  TRACETREE_RETURN_NOT_OK(ReadFrame(worker->fd, &reply));

  Json::Value value;
  TRACETREE_RETURN_NOT_OK(utils::StringToJsonObject(reply, &value));
  if (!value[kOkKey].isBool()) {
    return Status::Internal("malformed worker reply");
  }

  if (value[kOkKey].asBool()) {
    *result = value[kResultKey].asString();
  } else {
    *task_error = value[kErrorKey].asString();
    if (task_error->empty()) *task_error = "task failed";
  }
  return Status::OK();
}

void TraceProcessPool::WorkerLoop(int fd) {
  LOG_DEBUG << fmt::format("worker({}) of pool({}) started.", ::getpid(),
                           name_);

  // drop the copy of the forking thread's span
  SwapCurrentSpan(nullptr);

  while (true) {
    std::string frame;
    Status s = ReadFrame(fd, &frame);
    if (!s.ok()) {
      if (s.IsAbort()) break;
      LOG(ERROR) << fmt::format("worker({}) read fail, status({}).",
                                ::getpid(), s.ToString());
      ::close(fd);
      google::FlushLogFiles(google::INFO);
      ::_exit(1);
    }

    s = WriteFrame(fd, RunRequest(frame));
    if (!s.ok()) {
      LOG(ERROR) << fmt::format("worker({}) write fail, status({}).",
                                ::getpid(), s.ToString());
      ::close(fd);
      google::FlushLogFiles(google::INFO);
      ::_exit(1);
    }
  }

  ::close(fd);
  google::FlushLogFiles(google::INFO);
}

std::string TraceProcessPool::RunRequest(const std::string& frame) {
  std::string reply = utils::JsonToString(HandleRequest(frame));
  if (ExceedFrameSize(reply)) {
    Json::Value error(Json::objectValue);
    error[kOkKey] = false;
    error[kErrorKey] = fmt::format("result too large: {} bytes", reply.size());
    return utils::JsonToString(error);
  }
  return reply;
}

Json::Value TraceProcessPool::HandleRequest(const std::string& frame) {
  Json::Value reply(Json::objectValue);
  reply[kOkKey] = false;

  Json::Value request;
  Status s = utils::StringToJsonObject(frame, &request);
  if (!s.ok()) {
    reply[kErrorKey] = fmt::format("bad request: {}", s.ToString());
    return reply;
  }

  auto it = tasks_.find(request[kTaskKey].asString());
  if (it == tasks_.end()) {
    reply[kErrorKey] =
        fmt::format("unknown task: {}", request[kTaskKey].asString());
    return reply;
  }

  SpanSPtr span;
  if (request.isMember(kSpanRefKey)) {
    s = ResolveSpanRef(request[kSpanRefKey].asString(), &span);
    if (!s.ok()) {
      reply[kErrorKey] = fmt::format("resolve span fail: {}", s.ToString());
      return reply;
    }
  }

  SpanContextGuard guard(span);
  try {
    reply[kResultKey] = it->second(request[kArgKey].asString());
    reply[kOkKey] = true;
  } catch (const std::exception& e) {
    reply[kErrorKey] = e.what();
  } catch (...) {
    reply[kErrorKey] = "unknown exception";
  }

  return reply;
}

}  // namespace tracetree
