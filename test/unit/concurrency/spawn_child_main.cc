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

// Started by the spawn tests. argv[1] is the id of the span the parent had
// when spawning, or "none" when no span is expected. Exits 0 when the
// inherited span matches, and records a "spawned" child under it.

#include <string>

#include "common/logging.h"
#include "gflags/gflags.h"
#include "trace/concurrency/trace_process.h"
#include "trace/context.h"
#include "trace/trace_scope.h"

int main(int argc, char** argv) {
  google::ParseCommandLineFlags(&argc, &argv, true);
  if (argc < 2) return 2;

  tracetree::Logger::Init("tracetree-spawn-child");

  std::string expected = argv[1];
  tracetree::InheritedSpanScope inherited;

  if (expected == "none") {
    return (inherited.status().IsNotFound() &&
            tracetree::CurrentSpan() == nullptr)
               ? 0
               : 3;
  }

  if (!inherited.status().ok()) {
    LOG(ERROR) << "no inherited span: " << inherited.status().ToString();
    return 4;
  }
  if (tracetree::CurrentSpan()->Id().ToString() != expected) return 5;

  {
    tracetree::TraceScope scope("spawned");
    if (scope.span() == nullptr) return 6;
  }
  return 0;
}
