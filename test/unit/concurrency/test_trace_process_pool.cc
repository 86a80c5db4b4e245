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

#include <unistd.h>

#include <future>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/options/trace.h"
#include "gflags/gflags.h"
#include "gtest/gtest.h"
#include "helper/temp_dir.h"
#include "trace/concurrency/trace_process_pool.h"
#include "trace/context.h"
#include "trace/sqlite/span_db.h"
#include "trace/sqlite/sqlite_tracing.h"
#include "trace/trace_scope.h"

namespace tracetree {

class TraceProcessPoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(pool_.RegisterTask("span_id", [](const std::string&) {
                       SpanSPtr span = CurrentSpan();
                       return span == nullptr ? std::string("none")
                                              : span->Id().ToString();
                     }).ok());
    ASSERT_TRUE(pool_.RegisterTask("create_child", [](const std::string& arg) {
                       TraceScope scope(arg);
                       return std::string("ok");
                     }).ok());
    ASSERT_TRUE(pool_.RegisterTask("fail", [](const std::string& arg)
                                               -> std::string {
                       throw std::runtime_error("task failed: " + arg);
                     }).ok());
    ASSERT_TRUE(pool_.RegisterTask("pid", [](const std::string&) {
                       return std::to_string(::getpid());
                     }).ok());

    ASSERT_TRUE(pool_.Start().ok());
  }

  void TearDown() override { EXPECT_TRUE(pool_.Stop().ok()); }

  test::TempDir dir_;
  TraceProcessPool pool_{"trace_procs", 2};
};

TEST_F(TraceProcessPoolTest, RunsInWorkerProcess) {
  std::string pid = pool_.Submit("pid", "").get();
  EXPECT_NE(pid, std::to_string(::getpid()));
  EXPECT_EQ(pool_.AliveWorkers(), 2);
}

TEST_F(TraceProcessPoolTest, SubmissionTimeSpan) {
  SqliteTracing tracing(dir_.File("trace.db"));
  TracingScope scope(&tracing);
  ASSERT_TRUE(scope.status().ok());

  SpanId ctx1;
  SpanId ctx2;
  std::future<std::string> id1;
  std::future<std::string> id2;
  std::future<std::string> child1;
  std::future<std::string> child2;
  {
    TraceScope ctx("ctx1");
    ctx1 = ctx.span()->Id();
    id1 = pool_.Submit("span_id", "");
    child1 = pool_.Submit("create_child", "task1");
  }
  {
    TraceScope ctx("ctx2");
    ctx2 = ctx.span()->Id();
    id2 = pool_.Submit("span_id", "");
    child2 = pool_.Submit("create_child", "task2");
  }

  EXPECT_EQ(id1.get(), ctx1.ToString());
  EXPECT_EQ(id2.get(), ctx2.ToString());
  EXPECT_EQ(child1.get(), "ok");
  EXPECT_EQ(child2.get(), "ok");

  const auto& db = tracing.Database();
  std::vector<SpanId> ids;
  ASSERT_TRUE(db->GetChildrenIds(ctx1, &ids).ok());
  ASSERT_EQ(ids.size(), 1);
  SpanRecord record;
  ASSERT_TRUE(db->GetSpan(ids[0], &record).ok());
  EXPECT_EQ(record.name, "task1");

  ASSERT_TRUE(db->GetChildrenIds(ctx2, &ids).ok());
  ASSERT_EQ(ids.size(), 1);
  ASSERT_TRUE(db->GetSpan(ids[0], &record).ok());
  EXPECT_EQ(record.name, "task2");
}

TEST_F(TraceProcessPoolTest, WorkerSlotReset) {
  {
    SqliteTracing tracing(dir_.File("trace.db"));
    TracingScope scope(&tracing);
    ASSERT_TRUE(scope.status().ok());

    std::vector<std::future<std::string>> futures;
    for (int i = 0; i < 4; ++i) futures.push_back(pool_.Submit("span_id", ""));
    for (auto& future : futures) EXPECT_NE(future.get(), "none");
  }

  std::vector<std::future<std::string>> futures;
  for (int i = 0; i < 4; ++i) futures.push_back(pool_.Submit("span_id", ""));
  for (auto& future : futures) EXPECT_EQ(future.get(), "none");
}

TEST_F(TraceProcessPoolTest, TaskErrorThroughFuture) {
  auto future = pool_.Submit("fail", "x");
  try {
    future.get();
    FAIL() << "expect ProcessTaskError";
  } catch (const ProcessTaskError& e) {
    EXPECT_NE(std::string(e.what()).find("task failed: x"), std::string::npos);
  }

  // the worker survives a failed task
  EXPECT_EQ(pool_.Submit("span_id", "").get(), "none");
  EXPECT_EQ(pool_.AliveWorkers(), 2);
}

TEST_F(TraceProcessPoolTest, UnknownTask) {
  auto future = pool_.Submit("no_such_task", "");
  EXPECT_THROW(future.get(), ProcessTaskError);
}

TEST_F(TraceProcessPoolTest, RegisterAfterStart) {
  Status s = pool_.RegisterTask(
      "late", [](const std::string& arg) { return arg; });
  EXPECT_TRUE(s.IsAbort());
}

TEST_F(TraceProcessPoolTest, SubmitAfterStop) {
  ASSERT_TRUE(pool_.Stop().ok());
  auto future = pool_.Submit("span_id", "");
  EXPECT_THROW(future.get(), ProcessTaskError);
}

// one worker, so a retired worker would fail every later submission
class TraceProcessPoolFrameSizeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    FLAGS_trace_max_frame_size = 4096;

    ASSERT_TRUE(pool_.RegisterTask("echo", [](const std::string& arg) {
                       return arg;
                     }).ok());
    ASSERT_TRUE(pool_.RegisterTask("repeat", [](const std::string& arg) {
                       return std::string(std::stoul(arg), 'b');
                     }).ok());

    ASSERT_TRUE(pool_.Start().ok());
  }

  void TearDown() override { EXPECT_TRUE(pool_.Stop().ok()); }

  gflags::FlagSaver flag_saver_;
  TraceProcessPool pool_{"frame_procs", 1};
};

TEST_F(TraceProcessPoolFrameSizeTest, OversizedRequest) {
  auto future = pool_.Submit("echo", std::string(8192, 'a'));
  try {
    future.get();
    FAIL() << "expect ProcessTaskError";
  } catch (const ProcessTaskError& e) {
    EXPECT_NE(std::string(e.what()).find("request too large"),
              std::string::npos);
  }

  EXPECT_EQ(pool_.Submit("echo", "hello").get(), "hello");
  EXPECT_EQ(pool_.AliveWorkers(), 1);
}

TEST_F(TraceProcessPoolFrameSizeTest, OversizedResult) {
  auto future = pool_.Submit("repeat", "8192");
  try {
    future.get();
    FAIL() << "expect ProcessTaskError";
  } catch (const ProcessTaskError& e) {
    EXPECT_NE(std::string(e.what()).find("result too large"),
              std::string::npos);
  }

  EXPECT_EQ(pool_.Submit("repeat", "16").get(), std::string(16, 'b'));
  EXPECT_EQ(pool_.Submit("echo", "hello").get(), "hello");
  EXPECT_EQ(pool_.AliveWorkers(), 1);
}

TEST(TraceProcessPoolRegisterTest, DuplicateTask) {
  TraceProcessPool pool("dup", 1);
  ASSERT_TRUE(
      pool.RegisterTask("t", [](const std::string& arg) { return arg; }).ok());
  EXPECT_TRUE(
      pool.RegisterTask("t", [](const std::string& arg) { return arg; })
          .IsExist());
}

}  // namespace tracetree
