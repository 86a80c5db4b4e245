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

#ifndef TRACETREE_TRACE_REMOTE_REMOTE_TRACING_H_
#define TRACETREE_TRACE_REMOTE_REMOTE_TRACING_H_

#include <memory>
#include <optional>
#include <string>

#include "trace/remote/remote_span.h"
#include "trace/remote/server_runner.h"
#include "trace/remote/span_client.h"
#include "trace/tracing.h"

namespace tracetree {

struct RemoteTracingOption {
  // Connect to this server, e.g. "http://127.0.0.1:8000". When empty a
  // tracetree-server over db_path is started on Enter() and stopped on
  // Exit().
  std::string server_url;
  std::string db_path;
  // Empty means FLAGS_trace_root_name.
  std::string root_name;
  // Continue this root instead of creating one.
  std::optional<SpanId> root_id;
};

// Spans live in a span server, so several processes can grow one tree.
// The root is created on Enter(), once the server is reachable. A tree of a
// server started by the tracing can no longer be read once it exited, read
// db_path with SqliteTracing instead.
class RemoteTracing : public Tracing {
 public:
  explicit RemoteTracing(const RemoteTracingOption& option);
  ~RemoteTracing() override;

  SpanSPtr RootSpan() const override { return root_; }

  Status GetTree(TreeSPtr* tree) const override;

  // Empty before Enter().
  std::string ServerUrl() const;

  const remote::SpanClientSPtr& Client() const { return client_; }

 protected:
  Status OnEnter() override;

  void OnExit() override;

 private:
  Status CreateRoot();

  RemoteTracingOption option_;
  std::unique_ptr<remote::ServerProcessRunner> runner_;
  remote::SpanClientSPtr client_;
  std::shared_ptr<RemoteSpan> root_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_REMOTE_REMOTE_TRACING_H_
