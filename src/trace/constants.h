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

#ifndef TRACETREE_TRACE_CONSTANTS_H_
#define TRACETREE_TRACE_CONSTANTS_H_

namespace tracetree {

// common span data keys
inline constexpr char kStartTimeKey[] = "start_time";
inline constexpr char kEndTimeKey[] = "end_time";
inline constexpr char kNameKey[] = "name";
inline constexpr char kDataKey[] = "data";
inline constexpr char kChildrenKey[] = "children";

// TraceCall()
inline constexpr char kFunctionKey[] = "trace_function";
inline constexpr char kFunctionNameKey[] = "name";
inline constexpr char kFunctionReturnedKey[] = "returned";

// exception recorded by a traced scope
inline constexpr char kExceptionKey[] = "exception";
inline constexpr char kExceptionTypeKey[] = "type";
inline constexpr char kExceptionValueKey[] = "value";
inline constexpr char kExceptionTracebackKey[] = "traceback";

// environment variable carrying the serialized SpanRef into a spawned program
inline constexpr char kSpanRefEnv[] = "TRACETREE_SPAN_REF";

}  // namespace tracetree

#endif  // TRACETREE_TRACE_CONSTANTS_H_
