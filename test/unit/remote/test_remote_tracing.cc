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

#include <string>
#include <vector>

#include "common/options/trace.h"
#include "gtest/gtest.h"
#include "helper/temp_dir.h"
#include "trace/concurrency/trace_process.h"
#include "trace/context.h"
#include "trace/remote/remote_tracing.h"
#include "trace/remote/span_client.h"
#include "trace/sqlite/sqlite_tracing.h"
#include "trace/trace_scope.h"
#include "trace/tree_json.h"

namespace tracetree {

class RemoteTracingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    FLAGS_trace_server_binary = TRACETREE_TEST_SERVER_BINARY;
  }

  RemoteTracingOption Option() const {
    RemoteTracingOption option;
    option.db_path = dir_.File("remote.db");
    option.root_name = "remote_root";
    return option;
  }

  test::TempDir dir_;
};

TEST_F(RemoteTracingTest, EndToEndSecondClient) {
  RemoteTracing tracing(Option());
  EXPECT_TRUE(tracing.ServerUrl().empty());

  TracingScope scope(&tracing);
  ASSERT_TRUE(scope.status().ok()) << scope.status().ToString();
  ASSERT_FALSE(tracing.ServerUrl().empty());

  { TraceScope first("first"); }
  { TraceScope second("second"); }

  // an independent client against the same server
  remote::SpanClient client(tracing.ServerUrl());
  ASSERT_TRUE(client.Init().ok());

  Json::Value tree;
  ASSERT_TRUE(client.GetTree(&tree).ok());
  EXPECT_EQ(tree["name"].asString(), "remote_root");
  ASSERT_EQ(tree["children"].size(), 2);
  EXPECT_EQ(tree["children"][0]["name"].asString(), "first");
  EXPECT_EQ(tree["children"][1]["name"].asString(), "second");
  EXPECT_TRUE(tree["children"][0]["children"].empty());

  TreeSPtr remote_tree;
  ASSERT_TRUE(tracing.GetTree(&remote_tree).ok());
  size_t count = 0;
  ASSERT_TRUE(CountTreeNodes(*remote_tree, &count).ok());
  EXPECT_EQ(count, 3);
}

TEST_F(RemoteTracingTest, DatabaseOutlivesServer) {
  SpanId root_id;
  {
    RemoteTracing tracing(Option());
    TracingScope scope(&tracing);
    ASSERT_TRUE(scope.status().ok()) << scope.status().ToString();
    root_id = tracing.RootSpan()->Id();
    LogWithTrace("event", Json::Value(Json::objectValue));
  }

  SqliteTracing reader(Option().db_path, root_id);
  ASSERT_TRUE(reader.Init().ok());

  TreeSPtr tree;
  ASSERT_TRUE(reader.GetTree(&tree).ok());
  Json::Value json;
  ASSERT_TRUE(TreeToJson(*tree, &json).ok());
  EXPECT_EQ(json["name"].asString(), "remote_root");
  EXPECT_TRUE(json["data"].isMember("end_time"));
  ASSERT_EQ(json["children"].size(), 1);
  EXPECT_EQ(json["children"][0]["name"].asString(), "event");
}

TEST_F(RemoteTracingTest, SpawnedProcessJoinsRemoteTree) {
  RemoteTracing tracing(Option());
  TracingScope scope(&tracing);
  ASSERT_TRUE(scope.status().ok()) << scope.status().ToString();

  TraceProcess process(TRACETREE_TEST_SPAWN_CHILD,
                       {tracing.RootSpan()->Id().ToString()});
  ASSERT_TRUE(process.Start().ok());
  int exit_code = -1;
  ASSERT_TRUE(process.Join(&exit_code).ok());
  EXPECT_EQ(exit_code, 0);

  std::vector<SpanId> ids;
  ASSERT_TRUE(
      tracing.Client()->GetChildrenIds(tracing.RootSpan()->Id(), &ids).ok());
  ASSERT_EQ(ids.size(), 1);
}

TEST_F(RemoteTracingTest, MissingDatabaseAndUrl) {
  RemoteTracing tracing(RemoteTracingOption{});
  EXPECT_TRUE(tracing.Enter().IsInvalidParam());
  EXPECT_FALSE(tracing.IsActive());
}

}  // namespace tracetree
