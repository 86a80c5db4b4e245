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

#include "trace/memory/memory_tracing.h"

#include "common/options/trace.h"

namespace tracetree {

MemoryTracing::MemoryTracing() : MemoryTracing(FLAGS_trace_root_name) {}

MemoryTracing::MemoryTracing(const std::string& root_name)
    : root_(MemorySpan::NewRoot(root_name, Json::Value(Json::objectValue))) {}

}  // namespace tracetree
