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

#include <json/json.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "helper/temp_dir.h"
#include "trace/concurrency/trace_thread.h"
#include "trace/concurrency/trace_thread_pool.h"
#include "trace/context.h"
#include "trace/memory/memory_tracing.h"
#include "trace/sqlite/sqlite_tracing.h"
#include "trace/trace_scope.h"

namespace tracetree {

static std::vector<std::string> ChildNames(const MemorySpanSPtr& span) {
  std::vector<std::string> names;
  for (const auto& child : span->ChildSpans()) {
    std::string name;
    EXPECT_TRUE(child->Name(&name).ok());
    names.push_back(name);
  }
  return names;
}

TEST(TraceThreadTest, SameHandleInThread) {
  MemoryTracing tracing;
  TracingScope scope(&tracing);

  SpanSPtr seen;
  TraceThread thread([&seen]() { seen = CurrentSpan(); });
  thread.Join();

  EXPECT_EQ(seen, tracing.RootSpan());
}

TEST(TraceThreadTest, CapturedAtConstruction) {
  MemoryTracing tracing;
  TracingScope scope(&tracing);

  MemorySpanSPtr outer;
  TraceThread thread;
  {
    TraceScope parent("parent");
    outer = std::dynamic_pointer_cast<MemorySpan>(parent.span());
    thread = TraceThread([]() { TraceScope child("in_thread"); });
  }
  thread.Join();

  ASSERT_NE(outer, nullptr);
  EXPECT_EQ(ChildNames(outer), std::vector<std::string>{"in_thread"});
  EXPECT_EQ(ChildNames(tracing.Root()), std::vector<std::string>{"parent"});
}

TEST(TraceThreadTest, NoTracing) {
  bool empty = false;
  TraceThread thread([&empty]() { empty = (CurrentSpan() == nullptr); });
  thread.Join();
  EXPECT_TRUE(empty);
}

TEST(TraceThreadTest, SqliteIdEqual) {
  test::TempDir dir;
  SqliteTracing tracing(dir.File("trace.db"));
  TracingScope scope(&tracing);
  ASSERT_TRUE(scope.status().ok());

  SpanId seen;
  TraceThread thread([&seen]() { seen = CurrentSpanSafe()->Id(); });
  thread.Join();

  EXPECT_EQ(seen, tracing.RootSpan()->Id());
}

class TraceThreadPoolTest : public ::testing::Test {
 protected:
  void SetUp() override { pool_.Start(); }

  void TearDown() override { pool_.Stop(); }

  TraceThreadPool pool_{"trace_test_pool", 1};
};

TEST_F(TraceThreadPoolTest, SubmissionTimeCapture) {
  MemoryTracing tracing;
  TracingScope scope(&tracing);

  // hold the single worker until both tasks are queued
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();
  auto blocker = pool_.Submit([opened]() { opened.wait(); });

  MemorySpanSPtr ctx1;
  MemorySpanSPtr ctx2;
  std::future<void> task1;
  std::future<void> task2;
  {
    TraceScope ctx("ctx1");
    ctx1 = std::dynamic_pointer_cast<MemorySpan>(ctx.span());
    task1 = pool_.Submit([]() { TraceScope task("task1"); });
  }
  {
    TraceScope ctx("ctx2");
    ctx2 = std::dynamic_pointer_cast<MemorySpan>(ctx.span());
    task2 = pool_.Submit([]() { TraceScope task("task2"); });
  }

  gate.set_value();
  blocker.get();
  task1.get();
  task2.get();

  EXPECT_EQ(ChildNames(ctx1), std::vector<std::string>{"task1"});
  EXPECT_EQ(ChildNames(ctx2), std::vector<std::string>{"task2"});
}

TEST_F(TraceThreadPoolTest, WorkerSlotRestored) {
  {
    MemoryTracing tracing;
    TracingScope scope(&tracing);
    auto traced = pool_.Submit([]() { return CurrentSpan() != nullptr; });
    EXPECT_TRUE(traced.get());
  }

  auto untraced = pool_.Submit([]() { return CurrentSpan() == nullptr; });
  EXPECT_TRUE(untraced.get());
}

TEST_F(TraceThreadPoolTest, ExceptionThroughFuture) {
  auto future =
      pool_.Submit([]() -> int { throw std::runtime_error("task failed"); });
  EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(TraceThreadPoolTest, QueuedTaskNum) {
  std::promise<void> started;
  std::future<void> running = started.get_future();
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();
  auto blocker = pool_.Submit([&started, opened]() {
    started.set_value();
    opened.wait();
  });
  running.wait();
  EXPECT_EQ(pool_.GetTaskNum(), 0);

  auto task1 = pool_.Submit([]() { return 1; });
  auto task2 = pool_.Submit([]() { return 2; });
  EXPECT_EQ(pool_.GetTaskNum(), 2);

  gate.set_value();
  blocker.get();
  EXPECT_EQ(task1.get(), 1);
  EXPECT_EQ(task2.get(), 2);
  EXPECT_EQ(pool_.GetTaskNum(), 0);
}

TEST_F(TraceThreadPoolTest, StopRunsQueuedTasks) {
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();
  auto blocker = pool_.Submit([opened]() { opened.wait(); });
  std::vector<std::future<int>> futures;
  for (int i = 0; i < 4; ++i) {
    futures.push_back(pool_.Submit([i]() { return i; }));
  }

  gate.set_value();
  pool_.Stop();

  blocker.get();
  for (int i = 0; i < 4; ++i) EXPECT_EQ(futures[i].get(), i);
}

TEST_F(TraceThreadPoolTest, SubmitAfterStop) {
  EXPECT_EQ(pool_.Submit([]() { return 1; }).get(), 1);
  pool_.Stop();

  auto future = pool_.Submit([]() { return 2; });
  ASSERT_EQ(future.wait_for(std::chrono::seconds(0)),
            std::future_status::ready);
  EXPECT_THROW(future.get(), ThreadPoolStoppedError);
  EXPECT_EQ(pool_.GetTaskNum(), 0);
}

TEST(TraceThreadPoolStartTest, SubmitBeforeStart) {
  TraceThreadPool pool("idle_pool", 1);
  auto future = pool.Submit([]() {});
  ASSERT_EQ(future.wait_for(std::chrono::seconds(0)),
            std::future_status::ready);
  EXPECT_THROW(future.get(), ThreadPoolStoppedError);

  pool.Start();
  EXPECT_NO_THROW(pool.Submit([]() {}).get());
  pool.Stop();
}

}  // namespace tracetree
