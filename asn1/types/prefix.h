// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_PREFIX_H_
#define ASN1_TYPES_PREFIX_H_

#include <compare>
#include <concepts>
#include <type_traits>
#include <utility>

#include "asn1/types/asn_type.h"
#include "asn1/types/tag.h"

namespace asn1 {

// How a type's tag relates to the tag of the value it carries.
enum class TaggingMode {
  // The type's own tag is the value's tag.
  kUntagged,
  // An IMPLICIT prefix: the declared tag replaces the value's tag.
  kImplicit,
  // An EXPLICIT prefix: the declared tag is written around the value's tag.
  kExplicit,
};

namespace internal {

template <typename T>
struct ExplicitInnerTag {};

template <AsnRepresentable T>
struct ExplicitInnerTag<T> {
  static constexpr Tag kInnerTag = kTagOf<T>;
};

}  // namespace internal

// Implicit<kTag, T> is a T whose ASN.1 tag has been replaced by |kTag|:
//
//   -- ASN.1
//   serialNumber [2] IMPLICIT INTEGER
//
//   // C++
//   Implicit<ContextSpecificTag(2), int64_t> serial_number;
//
// T does not need a tag of its own. The wrapper has the size and layout of T.
template <Tag kTag, typename T>
class Implicit {
 public:
  static constexpr Tag kAsnTag = kTag;
  static constexpr TaggingMode kTagging = TaggingMode::kImplicit;
  using ValueType = T;

  Implicit() = default;
  explicit Implicit(T value) : value_(std::move(value)) {}

  T& value() { return value_; }
  const T& value() const { return value_; }
  T& operator*() { return value_; }
  const T& operator*() const { return value_; }
  T* operator->() { return &value_; }
  const T* operator->() const { return &value_; }

  // Moves the value out, leaving this wrapper holding a moved-from T.
  T TakeValue() { return std::move(value_); }

  friend bool operator==(const Implicit& lhs, const Implicit& rhs)
    requires std::equality_comparable<T>
  {
    return lhs.value_ == rhs.value_;
  }
  friend auto operator<=>(const Implicit& lhs, const Implicit& rhs)
    requires std::three_way_comparable<T>
  {
    return lhs.value_ <=> rhs.value_;
  }

 private:
  T value_{};
};

// Explicit<kTag, T> is a T wrapped in an additional |kTag|. The inner tag is
// kept, and exposed as kInnerTag when T is representable:
//
//   -- ASN.1
//   version [0] EXPLICIT INTEGER
//
//   // C++
//   Explicit<ContextSpecificTag(0), int> version;
//   static_assert(decltype(version)::kInnerTag == kInteger);
//
// Since the inner tag is looked up when the wrapper type is instantiated, T
// must be complete at that point.
template <Tag kTag, typename T>
class Explicit : public internal::ExplicitInnerTag<T> {
 public:
  static constexpr Tag kAsnTag = kTag;
  static constexpr TaggingMode kTagging = TaggingMode::kExplicit;
  using ValueType = T;

  Explicit() = default;
  explicit Explicit(T value) : value_(std::move(value)) {}

  T& value() { return value_; }
  const T& value() const { return value_; }
  T& operator*() { return value_; }
  const T& operator*() const { return value_; }
  T* operator->() { return &value_; }
  const T* operator->() const { return &value_; }

  // Moves the value out, leaving this wrapper holding a moved-from T.
  T TakeValue() { return std::move(value_); }

  friend bool operator==(const Explicit& lhs, const Explicit& rhs)
    requires std::equality_comparable<T>
  {
    return lhs.value_ == rhs.value_;
  }
  friend auto operator<=>(const Explicit& lhs, const Explicit& rhs)
    requires std::three_way_comparable<T>
  {
    return lhs.value_ <=> rhs.value_;
  }

 private:
  T value_{};
};

// TaggingOf<T>::value is T's TaggingMode: kImplicit or kExplicit for the
// prefix wrappers, kUntagged for everything else.
template <typename T>
struct TaggingOf
    : std::integral_constant<TaggingMode, TaggingMode::kUntagged> {};

template <typename T>
  requires requires {
    { T::kTagging } -> std::convertible_to<TaggingMode>;
  }
struct TaggingOf<T> : std::integral_constant<TaggingMode, T::kTagging> {};

template <typename T>
inline constexpr TaggingMode kTaggingOf =
    TaggingOf<std::remove_cvref_t<T>>::value;

}  // namespace asn1

#endif  // ASN1_TYPES_PREFIX_H_
