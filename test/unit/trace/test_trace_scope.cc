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
#include "trace/constants.h"
#include "trace/context.h"
#include "trace/memory/memory_tracing.h"
#include "trace/trace_scope.h"

namespace tracetree {

class TraceScopeTest : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(tracing_.Enter().ok()); }

  void TearDown() override {
    ASSERT_TRUE(tracing_.Exit().ok());
    EXPECT_EQ(CurrentSpan(), nullptr);
  }

  Json::Value OnlyChildData() {
    auto children = tracing_.Root()->ChildSpans();
    EXPECT_EQ(children.size(), 1);
    Json::Value data;
    if (!children.empty()) {
      EXPECT_TRUE(children[0]->Data(&data).ok());
    }
    return data;
  }

  MemoryTracing tracing_;
};

static int Compute(int x) {
  TRACETREE_SCOPE();
  return x * 2;
}

TEST_F(TraceScopeTest, ScopeNamedAfterFunction) {
  EXPECT_EQ(Compute(21), 42);

  auto children = tracing_.Root()->ChildSpans();
  ASSERT_EQ(children.size(), 1);
  std::string name;
  ASSERT_TRUE(children[0]->Name(&name).ok());
  EXPECT_EQ(name, "Compute");

  Json::Value data;
  ASSERT_TRUE(children[0]->Data(&data).ok());
  EXPECT_TRUE(data.isMember(kStartTimeKey));
  EXPECT_TRUE(data.isMember(kEndTimeKey));
}

TEST_F(TraceScopeTest, ScopeRestoresParent) {
  {
    TRACETREE_SCOPE_NAMED("outer");
    SpanSPtr outer = CurrentSpan();
    {
      TRACETREE_SCOPE_NAMED("inner");
      EXPECT_NE(CurrentSpan(), outer);
    }
    EXPECT_EQ(CurrentSpan(), outer);
  }
  EXPECT_EQ(CurrentSpan(), tracing_.RootSpan());
}

TEST_F(TraceScopeTest, InitialDataAndUpdate) {
  {
    Json::Value init;
    init["stage"] = "load";
    TraceScope scope("work", init);

    Json::Value patch;
    patch["rows"] = 10;
    scope.Update(patch);
  }

  Json::Value data = OnlyChildData();
  EXPECT_EQ(data["stage"].asString(), "load");
  EXPECT_EQ(data["rows"].asInt(), 10);
}

TEST_F(TraceScopeTest, UpdateAfterScopeExit) {
  SpanSPtr span;
  {
    TraceScope scope("late");
    span = scope.span();
  }

  Json::Value patch;
  patch["after"] = true;
  ASSERT_TRUE(span->UpdateData(patch).ok());
  EXPECT_TRUE(OnlyChildData()["after"].asBool());
}

TEST_F(TraceScopeTest, ExceptionEscapingScopeIsRecorded) {
  EXPECT_THROW(
      {
        TraceScope scope("failing");
        throw std::runtime_error("boom");
      },
      std::runtime_error);

  Json::Value data = OnlyChildData();
  ASSERT_TRUE(data.isMember(kExceptionKey));
  EXPECT_TRUE(data[kExceptionKey].isMember(kExceptionTypeKey));
  EXPECT_TRUE(data.isMember(kEndTimeKey));
}

TEST_F(TraceScopeTest, TraceCallRecordsReturn) {
  int result = TraceCall("add", []() { return 1 + 2; });
  EXPECT_EQ(result, 3);

  Json::Value data = OnlyChildData();
  EXPECT_EQ(data[kFunctionKey][kFunctionNameKey].asString(), "add");
  EXPECT_EQ(data[kFunctionKey][kFunctionReturnedKey].asInt(), 3);
}

TEST_F(TraceScopeTest, TraceCallRecordsAndRethrows) {
  EXPECT_THROW(TraceCall("explode",
                         []() -> int {
                           throw std::invalid_argument("bad input");
                         }),
               std::invalid_argument);

  Json::Value data = OnlyChildData();
  EXPECT_EQ(data[kFunctionKey][kFunctionNameKey].asString(), "explode");
  EXPECT_FALSE(data[kFunctionKey].isMember(kFunctionReturnedKey));
  EXPECT_EQ(data[kExceptionKey][kExceptionTypeKey].asString(),
            "std::invalid_argument");
  EXPECT_EQ(data[kExceptionKey][kExceptionValueKey].asString(), "bad input");
  EXPECT_FALSE(data[kExceptionKey][kExceptionTracebackKey].asString().empty());
}

TEST_F(TraceScopeTest, TraceCallVoid) {
  bool called = false;
  TraceCall("side_effect", [&called]() { called = true; });
  EXPECT_TRUE(called);
  EXPECT_FALSE(OnlyChildData()[kFunctionKey].isMember(kFunctionReturnedKey));
}

TEST_F(TraceScopeTest, LogWithTrace) {
  Json::Value data;
  data["msg"] = "hello";
  LogWithTrace("", data);

  auto children = tracing_.Root()->ChildSpans();
  ASSERT_EQ(children.size(), 1);
  std::string name;
  ASSERT_TRUE(children[0]->Name(&name).ok());
  EXPECT_EQ(name, "log_with_trace");
  EXPECT_EQ(OnlyChildData()["msg"].asString(), "hello");
}

TEST(TraceScopeUntracedTest, NoCurrentSpan) {
  ASSERT_EQ(CurrentSpan(), nullptr);
  {
    TraceScope scope("untraced");
    EXPECT_EQ(scope.span(), nullptr);
    EXPECT_EQ(CurrentSpan(), nullptr);
    scope.Update(Json::Value(Json::objectValue));
  }
  EXPECT_EQ(TraceCall("untraced_call", []() { return 7; }), 7);
}

}  // namespace tracetree
