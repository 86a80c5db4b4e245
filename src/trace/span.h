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

#ifndef TRACETREE_TRACE_SPAN_H_
#define TRACETREE_TRACE_SPAN_H_

#include <json/json.h>

#include <memory>
#include <string>
#include <vector>

#include "common/status.h"
#include "trace/span_ref.h"
#include "utils/span_id.h"

namespace tracetree {

// A span is a named unit of traced work, the handle that is written to.
// Spans only know their parent, the tree is read through Tree.
//
// id, name and parent never change once created, data only changes through
// a merge patch. Backends that persist spans re-read the store on every
// Name()/Data() call, so updates made by other processes are visible.
class Span {
 public:
  virtual ~Span() = default;

  virtual const SpanId& Id() const = 0;

  virtual Status Name(std::string* name) const = 0;

  virtual Status Data(Json::Value* data) const = 0;

  // Create and persist a span whose parent is this span.
  // An empty name is replaced by FLAGS_trace_default_span_name.
  virtual Status NewChild(const std::string& name, const Json::Value& data,
                          SpanSPtr* child) = 0;

  // Merge patch (RFC 7396) into data, also valid after Close().
  virtual Status UpdateData(const Json::Value& patch) = 0;

  // Called once by the scope that created the span, when it exits.
  virtual void Close() {}

  virtual SpanRef Reference() const = 0;

  virtual std::string Backend() const = 0;
};

class Tree;
using TreeSPtr = std::shared_ptr<Tree>;

// Read view of a span together with its children.
class Tree {
 public:
  virtual ~Tree() = default;

  virtual Status Name(std::string* name) const = 0;

  virtual Status Data(Json::Value* data) const = 0;

  // Children in creation order, may hit the store.
  virtual Status Children(std::vector<TreeSPtr>* children) const = 0;

  // Sets nullptr for the root. NotSupport when the backend can not walk up.
  virtual Status Parent(TreeSPtr* parent) const {
    (void)parent;
    return Status::NotSupport("parent navigation not supported");
  }
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_SPAN_H_
