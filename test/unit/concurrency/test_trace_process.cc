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

#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "helper/temp_dir.h"
#include "trace/concurrency/trace_process.h"
#include "trace/context.h"
#include "trace/jsonlog/jsonlog_tracing.h"
#include "trace/memory/memory_tracing.h"
#include "trace/sqlite/sqlite_tracing.h"
#include "trace/trace_scope.h"

namespace tracetree {

static int RunChild(TraceProcess* process) {
  Status s = process->Start();
  EXPECT_TRUE(s.ok()) << s.ToString();
  if (!s.ok()) return -1;

  int exit_code = -1;
  s = process->Join(&exit_code);
  EXPECT_TRUE(s.ok()) << s.ToString();
  return exit_code;
}

static std::vector<std::string> ChildNames(const TreeSPtr& tree) {
  std::vector<TreeSPtr> children;
  EXPECT_TRUE(tree->Children(&children).ok());

  std::vector<std::string> names;
  for (const auto& child : children) {
    std::string name;
    EXPECT_TRUE(child->Name(&name).ok());
    names.push_back(name);
  }
  return names;
}

class TraceProcessTest : public ::testing::Test {
 protected:
  test::TempDir dir_;
};

TEST_F(TraceProcessTest, NoTracingInChild) {
  TraceProcess process([]() { return CurrentSpan() == nullptr ? 0 : 1; });
  EXPECT_EQ(RunChild(&process), 0);
  EXPECT_EQ(CurrentSpan(), nullptr);
}

TEST_F(TraceProcessTest, ForkMemoryIdEqual) {
  MemoryTracing tracing;
  TracingScope scope(&tracing);

  SpanId expected = tracing.RootSpan()->Id();
  TraceProcess process([expected]() {
    SpanSPtr span = CurrentSpan();
    if (span == nullptr) return 2;
    // a copy resolved from the reference, not the parent's object
    return (span->Id() == expected && span->Backend() == "memory") ? 0 : 3;
  });
  EXPECT_EQ(process.Method(), StartMethod::kFork);
  EXPECT_EQ(RunChild(&process), 0);
}

TEST_F(TraceProcessTest, ForkSqliteGrowsSharedTree) {
  SqliteTracing tracing(dir_.File("trace.db"));
  TracingScope scope(&tracing);
  ASSERT_TRUE(scope.status().ok());

  SpanId expected = tracing.RootSpan()->Id();
  TraceProcess process([expected]() {
    if (CurrentSpanSafe()->Id() != expected) return 3;
    TraceScope child("in_child");
    return 0;
  });
  EXPECT_EQ(RunChild(&process), 0);

  TreeSPtr tree;
  ASSERT_TRUE(tracing.GetTree(&tree).ok());
  EXPECT_EQ(ChildNames(tree), std::vector<std::string>{"in_child"});
}

TEST_F(TraceProcessTest, ForkJsonLogGrowsSharedTree) {
  JsonLogTracing tracing(dir_.File("trace.log"));
  {
    TracingScope scope(&tracing);
    ASSERT_TRUE(scope.status().ok());

    TraceProcess process([]() {
      TraceScope child("in_child");
      return 0;
    });
    EXPECT_EQ(RunChild(&process), 0);
  }

  TreeSPtr tree;
  ASSERT_TRUE(tracing.GetTree(&tree).ok());
  EXPECT_EQ(ChildNames(tree), std::vector<std::string>{"in_child"});
}

TEST_F(TraceProcessTest, ExceptionInChild) {
  MemoryTracing tracing;
  TracingScope scope(&tracing);

  TraceProcess process([]() -> int { throw std::runtime_error("child"); });
  EXPECT_EQ(RunChild(&process), 1);
}

TEST_F(TraceProcessTest, ExitCodeOfChild) {
  TraceProcess process([]() { return 7; });
  EXPECT_EQ(RunChild(&process), 7);
}

TEST_F(TraceProcessTest, JoinBeforeStart) {
  TraceProcess process([]() { return 0; });
  int exit_code = 0;
  EXPECT_TRUE(process.Join(&exit_code).IsAbort());
}

TEST_F(TraceProcessTest, SpawnSqliteIdEqual) {
  SqliteTracing tracing(dir_.File("trace.db"));
  TracingScope scope(&tracing);
  ASSERT_TRUE(scope.status().ok());

  TraceProcess process(TRACETREE_TEST_SPAWN_CHILD,
                       {tracing.RootSpan()->Id().ToString()});
  EXPECT_EQ(process.Method(), StartMethod::kSpawn);
  EXPECT_EQ(RunChild(&process), 0);

  TreeSPtr tree;
  ASSERT_TRUE(tracing.GetTree(&tree).ok());
  EXPECT_EQ(ChildNames(tree), std::vector<std::string>{"spawned"});
}

TEST_F(TraceProcessTest, SpawnMemoryIdEqual) {
  MemoryTracing tracing;
  TracingScope scope(&tracing);

  TraceProcess process(TRACETREE_TEST_SPAWN_CHILD,
                       {tracing.RootSpan()->Id().ToString()});
  EXPECT_EQ(RunChild(&process), 0);
}

TEST_F(TraceProcessTest, SpawnWithoutTracing) {
  TraceProcess process(TRACETREE_TEST_SPAWN_CHILD, {"none"});
  EXPECT_EQ(RunChild(&process), 0);
}

TEST_F(TraceProcessTest, SpawnMissingBinary) {
  TraceProcess process(dir_.File("no_such_binary"), {});
  EXPECT_EQ(RunChild(&process), 127);
}

}  // namespace tracetree
