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

#ifndef TRACETREE_TRACE_TRACE_SCOPE_H_
#define TRACETREE_TRACE_TRACE_SCOPE_H_

#include <json/json.h>

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

#include "trace/span.h"

namespace tracetree {

// Runs the enclosing block as a child span of the current span: the child is
// created with start_time, becomes the current span, and on destruction gets
// end_time, is closed and the previous span is restored.
// Without a current span nothing is traced.
class TraceScope {
 public:
  explicit TraceScope(const std::string& name,
                      const Json::Value& data = Json::Value(Json::objectValue));
  ~TraceScope();

  TraceScope(const TraceScope&) = delete;
  TraceScope& operator=(const TraceScope&) = delete;

  // nullptr when untraced.
  const SpanSPtr& span() const { return span_; }

  // Merge patch into the span data, ignored when untraced.
  void Update(const Json::Value& patch);

  // Record {type, value, traceback} under "exception".
  void RecordException(std::exception_ptr eptr);

 private:
  SpanSPtr span_;
  SpanSPtr prev_span_;
  int uncaught_exceptions_;
  bool exception_recorded_{false};
};

#define TRACETREE_CONCAT_IMPL(a, b) a##b
#define TRACETREE_CONCAT(a, b) TRACETREE_CONCAT_IMPL(a, b)

// Trace the rest of the enclosing block as a span named after the function.
#define TRACETREE_SCOPE() \
  ::tracetree::TraceScope TRACETREE_CONCAT(trace_scope_, __LINE__)(__func__)

#define TRACETREE_SCOPE_NAMED(name) \
  ::tracetree::TraceScope TRACETREE_CONCAT(trace_scope_, __LINE__)(name)

namespace detail {

void RecordFunctionStart(TraceScope* scope, const std::string& name);
void RecordFunctionReturned(TraceScope* scope, const std::string& name,
                            const Json::Value& returned);

}  // namespace detail

// Call fn inside a TraceScope named name. The result is recorded under
// trace_function.returned when it converts to json. An exception is recorded
// and rethrown unchanged.
template <class F>
auto TraceCall(const std::string& name, F&& fn) -> decltype(fn()) {
  using R = decltype(fn());

  TraceScope scope(name);
  detail::RecordFunctionStart(&scope, name);
  try {
    if constexpr (std::is_void_v<R>) {
      std::forward<F>(fn)();
    } else if constexpr (std::is_constructible_v<Json::Value, const R&>) {
      R result = std::forward<F>(fn)();
      detail::RecordFunctionReturned(&scope, name, Json::Value(result));
      return result;
    } else {
      return std::forward<F>(fn)();
    }
  } catch (...) {
    scope.RecordException(std::current_exception());
    throw;
  }
}

// Log data as a one-shot child span of the current span.
void LogWithTrace(const std::string& name, const Json::Value& data);

}  // namespace tracetree

#endif  // TRACETREE_TRACE_TRACE_SCOPE_H_
