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

#include "glog/logging.h"
#include "gtest/gtest.h"
#include "utils/json_util.h"
#include "utils/merge_patch.h"

namespace tracetree {

static Json::Value Parse(const std::string& str) {
  Json::Value value;
  Status s = utils::StringToJson(str, &value);
  CHECK(s.ok()) << "bad json in test: " << str;
  return value;
}

class MergePatchTest : public ::testing::Test {
 protected:
  void ExpectMerge(const std::string& target, const std::string& patch,
                   const std::string& expected) {
    Json::Value merged = MergePatch(Parse(target), Parse(patch));
    EXPECT_EQ(merged, Parse(expected))
        << target << " + " << patch << " = " << utils::JsonToString(merged);
  }
};

// test cases from appendix A of RFC 7396
TEST_F(MergePatchTest, RfcExamples) {
  ExpectMerge(R"({"a":"b"})", R"({"a":"c"})", R"({"a":"c"})");
  ExpectMerge(R"({"a":"b"})", R"({"b":"c"})", R"({"a":"b","b":"c"})");
  ExpectMerge(R"({"a":"b"})", R"({"a":null})", R"({})");
  ExpectMerge(R"({"a":"b","b":"c"})", R"({"a":null})", R"({"b":"c"})");
  ExpectMerge(R"({"a":["b"]})", R"({"a":"c"})", R"({"a":"c"})");
  ExpectMerge(R"({"a":"c"})", R"({"a":["b"]})", R"({"a":["b"]})");
  ExpectMerge(R"({"a":{"b":"c"}})", R"({"a":{"b":"d","c":null}})",
              R"({"a":{"b":"d"}})");
  ExpectMerge(R"({"a":[{"b":"c"}]})", R"({"a":[1]})", R"({"a":[1]})");
  ExpectMerge(R"(["a","b"])", R"(["c","d"])", R"(["c","d"])");
  ExpectMerge(R"({"a":"b"})", R"(["c"])", R"(["c"])");
  ExpectMerge(R"({"a":"foo"})", R"(null)", R"(null)");
  ExpectMerge(R"({"a":"foo"})", R"("bar")", R"("bar")");
  ExpectMerge(R"({"e":null})", R"({"a":1})", R"({"e":null,"a":1})");
  ExpectMerge(R"([1,2])", R"({"a":"b","c":null})", R"({"a":"b"})");
  ExpectMerge(R"({})", R"({"a":{"bb":{"ccc":null}}})", R"({"a":{"bb":{}}})");
}

TEST_F(MergePatchTest, NestedRemoval) {
  ExpectMerge(R"({"a":"b","c":{"d":"e","f":"g"}})",
              R"({"a":"z","c":{"f":null}})", R"({"a":"z","c":{"d":"e"}})");
}

TEST_F(MergePatchTest, NonObjectTarget) {
  ExpectMerge(R"("text")", R"({"a":1})", R"({"a":1})");
  ExpectMerge(R"(null)", R"({"a":{"b":null}})", R"({"a":{}})");
}

TEST_F(MergePatchTest, Idempotent) {
  const char* cases[][2] = {
      {R"({"a":"b","c":{"d":"e","f":"g"}})", R"({"a":"z","c":{"f":null}})"},
      {R"({"x":[1,2,3]})", R"({"x":{"y":null,"z":1}})"},
      {R"({"a":1})", R"(null)"},
      {R"([])", R"({"k":{"n":null}})"},
  };

  for (const auto& c : cases) {
    Json::Value target = Parse(c[0]);
    Json::Value patch = Parse(c[1]);
    Json::Value once = MergePatch(target, patch);
    EXPECT_EQ(MergePatch(once, patch), once) << c[0] << " + " << c[1];
  }
}

TEST_F(MergePatchTest, ApplyInPlace) {
  Json::Value target = Parse(R"({"start_time":"t0","count":1})");
  ApplyMergePatch(&target, Parse(R"({"end_time":"t1","count":null})"));
  EXPECT_EQ(target, Parse(R"({"start_time":"t0","end_time":"t1"})"));
}

}  // namespace tracetree
