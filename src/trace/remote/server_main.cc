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

#include <gflags/gflags.h>

#include <cstring>
#include <iostream>

#include "common/logging.h"
#include "common/options/trace.h"
#include "trace/remote/span_server.h"

DEFINE_int32(port, 8000, "port the span server listens on");
DEFINE_string(db_path, "./trace.db", "sqlite database holding the spans");

static int ParseOption(int argc, char** argv) {
  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
      std::cout << "Usage: tracetree-server --port=<port> --db_path=<path> "
                   "[--trace_server_listen_ip=<ip>]\n";
      return 1;
    }
  }

  gflags::ParseCommandLineNonHelpFlags(&argc, &argv, false);
  return 0;
}

int main(int argc, char** argv) {
  int rc = ParseOption(argc, argv);
  if (rc != 0) {
    return rc;
  }

  tracetree::Logger::Init("tracetree-server");

  tracetree::remote::SpanServer server(FLAGS_db_path);
  auto status =
      server.Start(tracetree::FLAGS_trace_server_listen_ip, FLAGS_port);
  if (!status.ok()) {
    LOG(ERROR) << "Start span server failed: " << status.ToString();
    return -1;
  }

  server.RunUntilAskedToQuit();

  status = server.Shutdown();
  return status.ok() ? 0 : -1;
}
