// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/open.h"

#include <memory>
#include <utility>

#include "base/logging.h"

namespace asn1 {

namespace {

using InstancePtr = std::unique_ptr<InstanceOf<Open>>;

Open::Value CloneValue(const Open::Value& value) {
  return absl::visit(
      [](const auto& held) -> Open::Value {
        using T = std::remove_cvref_t<decltype(held)>;
        if constexpr (std::is_same_v<T, InstancePtr>) {
          return std::make_unique<InstanceOf<Open>>(*held);
        } else {
          return Open::Value(absl::in_place_type<T>, held);
        }
      },
      value);
}

}  // namespace

Open::Open() = default;

Open::Open(InstanceOf<Open> instance)
    : value_(std::make_unique<InstanceOf<Open>>(std::move(instance))) {}

Open::Open(const Open& other) : value_(CloneValue(other.value_)) {}

Open::Open(Open&& other) noexcept : value_(std::move(other.value_)) {
  // A moved-from unique_ptr is null; leave |other| holding NULL instead.
  other.value_ = Null();
}

Open& Open::operator=(const Open& other) {
  if (this != &other)
    value_ = CloneValue(other.value_);
  return *this;
}

Open& Open::operator=(Open&& other) noexcept {
  if (this != &other) {
    value_ = std::move(other.value_);
    other.value_ = Null();
  }
  return *this;
}

Open::~Open() = default;

Tag Open::tag() const {
  return absl::visit(
      [](const auto& held) -> Tag {
        using T = std::remove_cvref_t<decltype(held)>;
        if constexpr (std::is_same_v<T, InstancePtr>) {
          return kTagOf<InstanceOf<Open>>;
        } else if constexpr (std::is_same_v<T, UnknownValue>) {
          return held.tag;
        } else {
          return kTagOf<T>;
        }
      },
      value_);
}

const InstanceOf<Open>* Open::GetInstanceOf() const {
  const InstancePtr* instance = absl::get_if<InstancePtr>(&value_);
  return instance ? instance->get() : nullptr;
}

bool operator==(const Open& lhs, const Open& rhs) {
  if (lhs.value_.index() != rhs.value_.index())
    return false;
  return absl::visit(
      [&rhs](const auto& held) -> bool {
        using T = std::remove_cvref_t<decltype(held)>;
        const T& other = absl::get<T>(rhs.value_);
        if constexpr (std::is_same_v<T, InstancePtr>) {
          DCHECK(held);
          DCHECK(other);
          return *held == *other;
        } else {
          return held == other;
        }
      },
      lhs.value_);
}

}  // namespace asn1
