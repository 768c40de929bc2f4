// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_CHOICE_H_
#define ASN1_TYPES_CHOICE_H_

#include <stddef.h>

#include <type_traits>
#include <utility>

#include "absl/types/variant.h"
#include "asn1/types/asn_type.h"
#include "asn1/types/tag.h"

namespace asn1 {

namespace internal {

template <typename T, typename... Ts>
inline constexpr bool kIsOneOf = (std::is_same_v<T, Ts> || ...);

// Returns true if no two of |Ts| share a tag. Alternatives tagged kNone (a
// nested CHOICE or an open type) are not compared; their tag is only known
// from the value.
template <typename... Ts>
constexpr bool HasDistinctTags() {
  constexpr Tag kTags[] = {kTagOf<Ts>...};
  for (size_t i = 0; i < sizeof...(Ts); ++i) {
    if (kTags[i] == kNone)
      continue;
    for (size_t j = i + 1; j < sizeof...(Ts); ++j) {
      if (kTags[i] == kTags[j])
        return false;
    }
  }
  return true;
}

}  // namespace internal

// The value of an ASN.1 CHOICE type: exactly one of |Alternatives|.
//
//   -- ASN.1
//   Time ::= CHOICE {
//     utcTime        UTCTime,
//     generalTime    GeneralizedTime }
//
//   // C++
//   using Time = Choice<UtcTime, GeneralizedTime>;
//
// The alternatives must be distinguishable by tag, so that a decoder can tell
// from the wire which one is present. Alternatives with the same underlying
// type are told apart with Implicit or Explicit.
//
// A CHOICE has no tag of its own. kAsnTag is kNone, and an encoder learns the
// tag to write from active_tag().
template <typename... Alternatives>
class Choice {
 public:
  static_assert(sizeof...(Alternatives) > 0, "A CHOICE needs alternatives");
  static_assert((AsnRepresentable<Alternatives> && ...),
                "Every CHOICE alternative must have an ASN.1 tag");
  static_assert(internal::HasDistinctTags<Alternatives...>(),
                "CHOICE alternatives must have distinct tags");

  static constexpr Tag kAsnTag = kNone;
  using Variant = absl::variant<Alternatives...>;

  // Holds a value-initialized first alternative.
  Choice() = default;

  template <typename T>
    requires internal::kIsOneOf<std::remove_cvref_t<T>, Alternatives...>
  explicit Choice(T&& value)
      : value_(absl::in_place_type<std::remove_cvref_t<T>>,
               std::forward<T>(value)) {}

  // Returns the position in |Alternatives| of the held alternative.
  size_t index() const { return value_.index(); }

  template <typename T>
  bool Is() const {
    return absl::holds_alternative<T>(value_);
  }

  // Returns the held value if it is a T, otherwise nullptr.
  template <typename T>
  T* GetIf() {
    return absl::get_if<T>(&value_);
  }
  template <typename T>
  const T* GetIf() const {
    return absl::get_if<T>(&value_);
  }

  const Variant& variant() const { return value_; }

  // Returns the tag of the held alternative. When that is itself a CHOICE or
  // an open type, this is the tag of the value it holds.
  Tag active_tag() const {
    return absl::visit(
        [](const auto& alternative) -> Tag {
          if constexpr (requires { alternative.active_tag(); }) {
            return alternative.active_tag();
          } else if constexpr (requires { alternative.tag(); }) {
            return alternative.tag();
          } else {
            return kTagOf<decltype(alternative)>;
          }
        },
        value_);
  }

  friend bool operator==(const Choice&, const Choice&) = default;

 private:
  Variant value_;
};

}  // namespace asn1

#endif  // ASN1_TYPES_CHOICE_H_
