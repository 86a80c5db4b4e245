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

#ifndef TRACETREE_TRACE_REMOTE_REMOTE_SPAN_H_
#define TRACETREE_TRACE_REMOTE_REMOTE_SPAN_H_

#include <json/json.h>

#include <string>
#include <vector>

#include "trace/remote/span_client.h"
#include "trace/span.h"

namespace tracetree {

// Handle of a span held by a span server, every operation is a request.
// A span missing on the server is a fatal error.
class RemoteSpan : public Span {
 public:
  RemoteSpan(remote::SpanClientSPtr client, const SpanId& id)
      : client_(std::move(client)), id_(id) {}

  // Connects to the referenced server, NotFound if it lacks the span.
  static Status FromReference(const SpanRef& ref, SpanSPtr* span);

  const SpanId& Id() const override { return id_; }

  Status Name(std::string* name) const override;

  Status Data(Json::Value* data) const override;

  Status NewChild(const std::string& name, const Json::Value& data,
                  SpanSPtr* child) override;

  Status UpdateData(const Json::Value& patch) override;

  SpanRef Reference() const override;

  std::string Backend() const override { return "remote"; }

 private:
  remote::SpanClientSPtr client_;
  const SpanId id_;
};

class RemoteTree : public Tree {
 public:
  RemoteTree(remote::SpanClientSPtr client, const SpanId& id)
      : client_(std::move(client)), id_(id) {}

  Status Name(std::string* name) const override;

  Status Data(Json::Value* data) const override;

  Status Children(std::vector<TreeSPtr>* children) const override;

  Status Parent(TreeSPtr* parent) const override;

  const SpanId& Id() const { return id_; }

 private:
  Status Get(SpanRecord* record) const;

  remote::SpanClientSPtr client_;
  const SpanId id_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_REMOTE_REMOTE_SPAN_H_
