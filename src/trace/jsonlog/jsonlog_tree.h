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

#ifndef TRACETREE_TRACE_JSONLOG_JSONLOG_TREE_H_
#define TRACETREE_TRACE_JSONLOG_JSONLOG_TREE_H_

#include <json/json.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "trace/span.h"

namespace tracetree {

class JsonLogTree;
using JsonLogTreeSPtr = std::shared_ptr<JsonLogTree>;

// Tree node rebuilt from a trace log.
class JsonLogTree : public Tree {
 public:
  JsonLogTree(const SpanId& id, const std::string& name,
              const Json::Value& data, std::optional<SpanId> parent_id)
      : id_(id), name_(name), data_(data), parent_id_(parent_id) {}

  Status Name(std::string* name) const override {
    *name = name_;
    return Status::OK();
  }

  Status Data(Json::Value* data) const override {
    *data = data_;
    return Status::OK();
  }

  Status Children(std::vector<TreeSPtr>* children) const override {
    children->assign(children_.begin(), children_.end());
    return Status::OK();
  }

  Status Parent(TreeSPtr* parent) const override {
    *parent = parent_.lock();
    return Status::OK();
  }

  const SpanId& Id() const { return id_; }

 private:
  friend Status ParseLoggedTree(const std::string& path, JsonLogTreeSPtr* root);

  const SpanId id_;
  const std::string name_;
  Json::Value data_;
  const std::optional<SpanId> parent_id_;
  std::weak_ptr<JsonLogTree> parent_;
  std::vector<JsonLogTreeSPtr> children_;
};

// Rebuild the tree of a trace log. Lines of the same id are merged in file
// order, children are ordered by id. Exactly one root must be present.
Status ParseLoggedTree(const std::string& path, JsonLogTreeSPtr* root);

}  // namespace tracetree

#endif  // TRACETREE_TRACE_JSONLOG_JSONLOG_TREE_H_
