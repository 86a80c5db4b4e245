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

#include "trace/memory/memory_span.h"

#include "common/logging.h"
#include "common/options/trace.h"
#include "trace/constants.h"
#include "utils/merge_patch.h"

namespace tracetree {

static constexpr char kParentIdKey[] = "parent_id";

MemorySpan::MemorySpan(const SpanId& id, const std::string& name,
                       const Json::Value& data,
                       std::optional<SpanId> parent_id,
                       std::weak_ptr<MemorySpan> parent)
    : id_(id),
      name_(name),
      parent_id_(parent_id),
      parent_(std::move(parent)),
      data_(data.isObject() ? data : Json::Value(Json::objectValue)) {}

MemorySpanSPtr MemorySpan::NewRoot(const std::string& name,
                                   const Json::Value& data) {
  return std::make_shared<MemorySpan>(NewSpanId(), name, data, std::nullopt,
                                      std::weak_ptr<MemorySpan>());
}

Status MemorySpan::FromReference(const SpanRef& ref, MemorySpanSPtr* span) {
  if (ref.kind != BackendKind::kMemory) {
    return Status::InvalidParam("not a memory span reference");
  }

  const Json::Value& snapshot = ref.snapshot;
  if (!snapshot.isObject() || !snapshot[kNameKey].isString()) {
    return Status::InvalidParam("memory span reference without snapshot");
  }

  std::optional<SpanId> parent_id;
  if (snapshot[kParentIdKey].isString()) {
    SpanId id;
    TRACETREE_RETURN_NOT_OK(
        SpanId::FromString(snapshot[kParentIdKey].asString(), &id));
    parent_id = id;
  }

  *span = std::make_shared<MemorySpan>(ref.id, snapshot[kNameKey].asString(),
                                       snapshot[kDataKey], parent_id,
                                       std::weak_ptr<MemorySpan>());
  return Status::OK();
}

Status MemorySpan::Name(std::string* name) const {
  *name = name_;
  return Status::OK();
}

Status MemorySpan::Data(Json::Value* data) const {
  std::lock_guard<std::mutex> lock(mutex_);
  *data = data_;
  return Status::OK();
}

Status MemorySpan::NewChild(const std::string& name, const Json::Value& data,
                            SpanSPtr* child) {
  auto span = std::make_shared<MemorySpan>(
      NewSpanId(), name.empty() ? FLAGS_trace_default_span_name : name, data,
      id_, weak_from_this());

  {
    std::lock_guard<std::mutex> lock(mutex_);
    children_.push_back(span);
  }

  LOG_DEBUG << "new memory span " << span->Id().ToString() << " under "
            << id_.ToString();

  *child = span;
  return Status::OK();
}

Status MemorySpan::UpdateData(const Json::Value& patch) {
  if (!patch.isObject()) {
    return Status::InvalidParam("span data patch must be an object");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ApplyMergePatch(&data_, patch);
  return Status::OK();
}

SpanRef MemorySpan::Reference() const {
  SpanRef ref;
  ref.kind = BackendKind::kMemory;
  ref.id = id_;

  Json::Value snapshot(Json::objectValue);
  snapshot[kNameKey] = name_;
  snapshot[kParentIdKey] =
      parent_id_.has_value() ? Json::Value(parent_id_->ToString())
                             : Json::Value(Json::nullValue);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot[kDataKey] = data_;
  }
  ref.snapshot = std::move(snapshot);

  return ref;
}

Status MemorySpan::Children(std::vector<TreeSPtr>* children) const {
  std::lock_guard<std::mutex> lock(mutex_);
  children->assign(children_.begin(), children_.end());
  return Status::OK();
}

Status MemorySpan::Parent(TreeSPtr* parent) const {
  if (!parent_id_.has_value()) {
    *parent = nullptr;
    return Status::OK();
  }

  auto locked = parent_.lock();
  if (locked == nullptr) {
    return Status::NotSupport("parent span lives in another process");
  }

  *parent = locked;
  return Status::OK();
}

std::vector<MemorySpanSPtr> MemorySpan::ChildSpans() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return children_;
}

}  // namespace tracetree
