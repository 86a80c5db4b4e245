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

#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "trace/context.h"
#include "trace/memory/memory_tracing.h"
#include "trace/trace_scope.h"

namespace tracetree {

TEST(ContextTest, EmptyOutsideTracing) {
  EXPECT_EQ(CurrentSpan(), nullptr);

  std::atomic<bool> empty_in_thread{false};
  std::thread thread([&]() { empty_in_thread = (CurrentSpan() == nullptr); });
  thread.join();
  EXPECT_TRUE(empty_in_thread.load());

  pid_t pid = ::fork();
  ASSERT_GE(pid, 0);
  if (pid == 0) {
    ::_exit(CurrentSpan() == nullptr ? 0 : 1);
  }
  int wstatus = 0;
  ASSERT_EQ(::waitpid(pid, &wstatus, 0), pid);
  ASSERT_TRUE(WIFEXITED(wstatus));
  EXPECT_EQ(WEXITSTATUS(wstatus), 0);

  EXPECT_EQ(CurrentSpan(), nullptr);
}

TEST(ContextTest, CurrentSpanSafeDiesOutsideTracing) {
  EXPECT_DEATH(CurrentSpanSafe(), "");
}

TEST(ContextTest, CurrentSpanAs) {
  MemoryTracing tracing;
  TracingScope scope(&tracing);

  auto span = CurrentSpanAs<MemorySpan>();
  EXPECT_EQ(span, tracing.Root());
}

TEST(ContextTest, GuardRestoresOnUnwind) {
  MemoryTracing tracing;
  TracingScope scope(&tracing);

  SpanSPtr other =
      MemorySpan::NewRoot("other", Json::Value(Json::objectValue));
  try {
    SpanContextGuard guard(other);
    EXPECT_EQ(CurrentSpan(), other);
    throw std::runtime_error("unwind");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(CurrentSpan(), tracing.RootSpan());
}

TEST(ContextTest, ThreadsAreIsolated) {
  const int kThreadNum = 4;

  std::vector<std::unique_ptr<MemoryTracing>> tracings;
  for (int i = 0; i < kThreadNum; ++i) {
    tracings.push_back(
        std::make_unique<MemoryTracing>("root-" + std::to_string(i)));
  }

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreadNum; ++i) {
    threads.emplace_back([&tracings, i]() {
      TracingScope scope(tracings[i].get());
      for (int j = 0; j < 10; ++j) {
        TraceScope child("child-" + std::to_string(i));
        EXPECT_EQ(CurrentSpan(), child.span());
      }
    });
  }
  for (auto& thread : threads) thread.join();

  for (int i = 0; i < kThreadNum; ++i) {
    auto children = tracings[i]->Root()->ChildSpans();
    ASSERT_EQ(children.size(), 10);
    for (const auto& child : children) {
      std::string name;
      ASSERT_TRUE(child->Name(&name).ok());
      EXPECT_EQ(name, "child-" + std::to_string(i));
    }
  }
  EXPECT_EQ(CurrentSpan(), nullptr);
}

}  // namespace tracetree
