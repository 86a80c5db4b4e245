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

#ifndef TRACETREE_TRACE_CONTEXT_H_
#define TRACETREE_TRACE_CONTEXT_H_

#include <memory>

#include "glog/logging.h"
#include "trace/span.h"

namespace tracetree {

// The current span of the calling thread, nullptr outside of any tracing.
SpanSPtr CurrentSpan();

// Like CurrentSpan(), but dies when there is no current span.
SpanSPtr CurrentSpanSafe();

// Install span as the current span of the calling thread, return the previous.
SpanSPtr SwapCurrentSpan(SpanSPtr span);

// The current span as a concrete backend type, dies on empty slot or when the
// current span is of another type.
template <class T>
std::shared_ptr<T> CurrentSpanAs() {
  SpanSPtr span = CurrentSpanSafe();
  auto typed = std::dynamic_pointer_cast<T>(span);
  CHECK(typed != nullptr) << "current span is a " << span->Backend()
                          << " span, not the requested type.";
  return typed;
}

// Install a span for the lifetime of the guard, the previous span is restored
// on destruction (also while unwinding).
class SpanContextGuard {
 public:
  explicit SpanContextGuard(SpanSPtr span)
      : prev_(SwapCurrentSpan(std::move(span))) {}

  ~SpanContextGuard() { SwapCurrentSpan(std::move(prev_)); }

  SpanContextGuard(const SpanContextGuard&) = delete;
  SpanContextGuard& operator=(const SpanContextGuard&) = delete;

 private:
  SpanSPtr prev_;
};

}  // namespace tracetree

#endif  // TRACETREE_TRACE_CONTEXT_H_
