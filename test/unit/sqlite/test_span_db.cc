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

#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "helper/temp_dir.h"
#include "trace/sqlite/span_db.h"
#include "utils/json_util.h"
#include "utils/span_id.h"

namespace tracetree {

class SpanDatabaseTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_ = std::make_shared<SpanDatabase>(dir_.File("spans/trace.db"));
    ASSERT_TRUE(db_->Init().ok());
  }

  static SpanRecord NewRecord(const std::string& name,
                              std::optional<SpanId> parent_id,
                              const std::string& data_json = "{}") {
    SpanRecord record;
    record.id = SpanId::New();
    record.name = name;
    record.data_json = data_json;
    record.parent_id = parent_id;
    return record;
  }

  static Json::Value DataOf(const SpanRecord& record) {
    Json::Value data;
    EXPECT_TRUE(utils::StringToJsonObject(record.data_json, &data).ok());
    return data;
  }

  test::TempDir dir_;
  SpanDatabaseSPtr db_;
};

TEST_F(SpanDatabaseTest, InitIsIdempotent) {
  EXPECT_TRUE(db_->Init().ok());

  SpanDatabase other(db_->Path());
  EXPECT_TRUE(other.Init().ok());
}

TEST_F(SpanDatabaseTest, InsertAndGet) {
  SpanRecord root = NewRecord("root", std::nullopt, R"({"k":"v"})");
  ASSERT_TRUE(db_->Insert(root).ok());

  SpanRecord got;
  ASSERT_TRUE(db_->GetSpan(root.id, &got).ok());
  EXPECT_EQ(got.id, root.id);
  EXPECT_EQ(got.name, "root");
  EXPECT_FALSE(got.parent_id.has_value());
  EXPECT_EQ(DataOf(got)["k"].asString(), "v");

  SpanRecord child = NewRecord("child", root.id);
  ASSERT_TRUE(db_->Insert(child).ok());
  ASSERT_TRUE(db_->GetSpan(child.id, &got).ok());
  ASSERT_TRUE(got.parent_id.has_value());
  EXPECT_EQ(*got.parent_id, root.id);
}

TEST_F(SpanDatabaseTest, InsertDuplicate) {
  SpanRecord record = NewRecord("root", std::nullopt);
  ASSERT_TRUE(db_->Insert(record).ok());
  EXPECT_TRUE(db_->Insert(record).IsExist());
}

TEST_F(SpanDatabaseTest, NotFound) {
  SpanRecord got;
  EXPECT_TRUE(db_->GetSpan(SpanId::New(), &got).IsNotFound());
  EXPECT_TRUE(db_->UpdateDataJson(SpanId::New(), R"({"a":1})").IsNotFound());

  SpanId id;
  double last_updated = 0;
  EXPECT_TRUE(db_->GetLastUpdatedSpanId(&id, &last_updated).IsNotFound());
  EXPECT_TRUE(db_->GetLastSpanId(&id).IsNotFound());
}

TEST_F(SpanDatabaseTest, InsertOrUpdateMergesData) {
  SpanRecord record = NewRecord("root", std::nullopt, R"({"a":1,"b":2})");
  ASSERT_TRUE(db_->InsertOrUpdate(record).ok());

  SpanRecord again = record;
  again.name = "renamed";
  again.data_json = R"({"b":null,"c":3})";
  ASSERT_TRUE(db_->InsertOrUpdate(again).ok());

  SpanRecord got;
  ASSERT_TRUE(db_->GetSpan(record.id, &got).ok());
  EXPECT_EQ(got.name, "root");
  Json::Value data = DataOf(got);
  EXPECT_EQ(data["a"].asInt(), 1);
  EXPECT_FALSE(data.isMember("b"));
  EXPECT_EQ(data["c"].asInt(), 3);
}

TEST_F(SpanDatabaseTest, UpdateDataJson) {
  SpanRecord record =
      NewRecord("root", std::nullopt, R"({"a":"b","c":{"d":"e","f":"g"}})");
  ASSERT_TRUE(db_->Insert(record).ok());
  ASSERT_TRUE(
      db_->UpdateDataJson(record.id, R"({"a":"z","c":{"f":null}})").ok());

  SpanRecord got;
  ASSERT_TRUE(db_->GetSpan(record.id, &got).ok());
  Json::Value expected;
  ASSERT_TRUE(
      utils::StringToJson(R"({"a":"z","c":{"d":"e"}})", &expected).ok());
  EXPECT_EQ(DataOf(got), expected);
}

TEST_F(SpanDatabaseTest, RootsAndChildrenOrderedById) {
  SpanRecord root1 = NewRecord("root1", std::nullopt);
  SpanRecord root2 = NewRecord("root2", std::nullopt);
  ASSERT_TRUE(db_->Insert(root2).ok());
  ASSERT_TRUE(db_->Insert(root1).ok());

  std::vector<SpanRecord> children;
  for (int i = 0; i < 5; ++i) {
    children.push_back(NewRecord("c" + std::to_string(i), root1.id));
  }
  // insertion order must not matter
  for (auto it = children.rbegin(); it != children.rend(); ++it) {
    ASSERT_TRUE(db_->Insert(*it).ok());
  }

  std::vector<SpanId> roots;
  ASSERT_TRUE(db_->GetRootIds(&roots).ok());
  ASSERT_EQ(roots.size(), 2);
  EXPECT_EQ(roots[0], root1.id);
  EXPECT_EQ(roots[1], root2.id);

  std::vector<SpanId> ids;
  ASSERT_TRUE(db_->GetChildrenIds(root1.id, &ids).ok());
  ASSERT_EQ(ids.size(), children.size());
  for (size_t i = 0; i < ids.size(); ++i) {
    EXPECT_EQ(ids[i], children[i].id);
  }

  ASSERT_TRUE(db_->GetChildrenIds(root2.id, &ids).ok());
  EXPECT_TRUE(ids.empty());

  SpanId last;
  ASSERT_TRUE(db_->GetLastSpanId(&last).ok());
  EXPECT_EQ(last, children.back().id);
}

TEST_F(SpanDatabaseTest, LastUpdated) {
  SpanRecord a = NewRecord("a", std::nullopt);
  SpanRecord b = NewRecord("b", a.id);
  ASSERT_TRUE(db_->Insert(a).ok());
  ASSERT_TRUE(db_->Insert(b).ok());

  SpanId id;
  double first = 0;
  ASSERT_TRUE(db_->GetLastUpdatedSpanId(&id, &first).ok());
  EXPECT_EQ(id, b.id);

  ASSERT_TRUE(db_->UpdateDataJson(a.id, R"({"touched":true})").ok());
  double second = 0;
  ASSERT_TRUE(db_->GetLastUpdatedSpanId(&id, &second).ok());
  EXPECT_EQ(id, a.id);
  EXPECT_GT(second, first);
}

TEST_F(SpanDatabaseTest, SpanIdsByName) {
  SpanRecord root = NewRecord("root", std::nullopt);
  SpanRecord x1 = NewRecord("x", root.id);
  SpanRecord y = NewRecord("y", root.id);
  SpanRecord x2 = NewRecord("x", root.id);
  for (const auto* record : {&root, &x1, &y, &x2}) {
    ASSERT_TRUE(db_->Insert(*record).ok());
  }

  std::vector<SpanId> ids;
  ASSERT_TRUE(db_->GetSpanIdsByName("x", &ids).ok());
  ASSERT_EQ(ids.size(), 2);
  EXPECT_EQ(ids[0], x1.id);
  EXPECT_EQ(ids[1], x2.id);

  ASSERT_TRUE(db_->GetSpanIdsByName("z", &ids).ok());
  EXPECT_TRUE(ids.empty());
}

TEST_F(SpanDatabaseTest, WalCheckpoint) {
  ASSERT_TRUE(db_->Insert(NewRecord("root", std::nullopt)).ok());
  EXPECT_TRUE(db_->WalCheckpoint().ok());
}

}  // namespace tracetree
