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

#include "trace/trace_scope.h"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <typeinfo>

#include "butil/debug/stack_trace.h"
#include "common/logging.h"
#include "trace/constants.h"
#include "trace/context.h"
#include "utils/time.h"

namespace tracetree {

static std::string Demangle(const char* name) {
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(
      abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
  return (status == 0 && demangled != nullptr) ? std::string(demangled.get())
                                               : std::string(name);
}

static std::string Traceback() {
  butil::debug::StackTrace stack;
  return stack.ToString();
}

TraceScope::TraceScope(const std::string& name, const Json::Value& data)
    : uncaught_exceptions_(std::uncaught_exceptions()) {
  SpanSPtr parent = CurrentSpan();
  if (parent == nullptr) return;

  Json::Value init = data.isObject() ? data : Json::Value(Json::objectValue);
  init[kStartTimeKey] = utils::GetNowFormatTime();

  Status s = parent->NewChild(name, init, &span_);
  if (!s.ok()) {
    LOG(ERROR) << "create child span fail, run untraced, name: " << name
               << ", status: " << s.ToString();
    span_ = nullptr;
    return;
  }

  prev_span_ = SwapCurrentSpan(span_);
}

TraceScope::~TraceScope() {
  if (span_ == nullptr) return;

  if (!exception_recorded_ &&
      std::uncaught_exceptions() > uncaught_exceptions_) {
    Json::Value exception(Json::objectValue);
    exception[kExceptionTypeKey] = "unknown";
    exception[kExceptionValueKey] = "exception escaped traced scope";
    exception[kExceptionTracebackKey] = Traceback();

    Json::Value patch(Json::objectValue);
    patch[kExceptionKey] = exception;
    Update(patch);
  }

  Json::Value patch(Json::objectValue);
  patch[kEndTimeKey] = utils::GetNowFormatTime();
  Update(patch);

  span_->Close();
  SwapCurrentSpan(std::move(prev_span_));
}

void TraceScope::Update(const Json::Value& patch) {
  if (span_ == nullptr) return;

  Status s = span_->UpdateData(patch);
  LOG_IF(ERROR, !s.ok()) << "update span fail, id: " << span_->Id().ToString()
                         << ", status: " << s.ToString();
}

void TraceScope::RecordException(std::exception_ptr eptr) {
  if (span_ == nullptr || eptr == nullptr) return;

  Json::Value exception(Json::objectValue);
  try {
    std::rethrow_exception(eptr);
  } catch (const std::exception& e) {
    exception[kExceptionTypeKey] = Demangle(typeid(e).name());
    exception[kExceptionValueKey] = e.what();
  } catch (...) {
    const std::type_info* type = abi::__cxa_current_exception_type();
    exception[kExceptionTypeKey] =
        (type != nullptr) ? Demangle(type->name()) : std::string("unknown");
    exception[kExceptionValueKey] = "";
  }
  exception[kExceptionTracebackKey] = Traceback();

  Json::Value patch(Json::objectValue);
  patch[kExceptionKey] = exception;
  Update(patch);
  exception_recorded_ = true;
}

namespace detail {

void RecordFunctionStart(TraceScope* scope, const std::string& name) {
  Json::Value patch(Json::objectValue);
  patch[kFunctionKey][kFunctionNameKey] = name;
  scope->Update(patch);
}

void RecordFunctionReturned(TraceScope* scope, const std::string& name,
                            const Json::Value& returned) {
  Json::Value patch(Json::objectValue);
  patch[kFunctionKey][kFunctionNameKey] = name;
  patch[kFunctionKey][kFunctionReturnedKey] = returned;
  scope->Update(patch);
}

}  // namespace detail

void LogWithTrace(const std::string& name, const Json::Value& data) {
  TraceScope scope(name.empty() ? std::string("log_with_trace") : name, data);
}

}  // namespace tracetree
