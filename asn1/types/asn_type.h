// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_ASN_TYPE_H_
#define ASN1_TYPES_ASN_TYPE_H_

#include <stddef.h>

#include <array>
#include <concepts>
#include <map>
#include <set>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/numeric/int128.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "absl/types/span.h"
#include "asn1/types/bit_string.h"
#include "asn1/types/integer.h"
#include "asn1/types/null.h"
#include "asn1/types/octet_string.h"
#include "asn1/types/oid.h"
#include "asn1/types/tag.h"
#include "asn1/types/time.h"

namespace asn1 {

// AsnType<T> associates a C++ type with the tag of the ASN.1 type it
// represents. Encoders and decoders read it at compile time:
//
//   AsnType<int>::kTag                          == kInteger
//   AsnType<std::vector<std::string>>::kTag     == kSequence
//   AsnType<Implicit<ContextSpecificTag(0), bool>>::kTag
//                                                == ContextSpecificTag(0)
//
// There are three ways for a type to provide a tag:
//
//   * a row in universal_type_list.h, for the built-in value types,
//   * a class member `static constexpr Tag kAsnTag`, which is how the tagging
//     wrappers, Choice, Open and generated structures do it,
//   * an explicit specialization of AsnType with a `static constexpr Tag
//     kTag` member, for types that cannot be modified.
//
// The primary template is deliberately empty: a type nobody bound has no
// kTag and does not satisfy AsnRepresentable.
template <typename T>
struct AsnType {};

template <typename T>
concept AsnRepresentable = requires {
  { AsnType<std::remove_cvref_t<T>>::kTag } -> std::convertible_to<Tag>;
};

template <AsnRepresentable T>
inline constexpr Tag kTagOf = AsnType<std::remove_cvref_t<T>>::kTag;

// The fixed-width integers, signed or unsigned. Character types and bool are
// excluded; they are not numbers in ASN.1.
template <typename T>
concept AsnInteger =
    std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char> &&
    !std::same_as<T, char8_t> && !std::same_as<T, char16_t> &&
    !std::same_as<T, char32_t> && !std::same_as<T, wchar_t>;

template <typename T>
concept HasAsnTag = requires {
  { T::kAsnTag } -> std::convertible_to<Tag>;
};

#define ASN1_UNIVERSAL_TYPE(type, tag)  \
  template <>                           \
  struct AsnType<type> {                \
    static constexpr Tag kTag = tag;    \
  };
#include "asn1/types/universal_type_list.h"
#undef ASN1_UNIVERSAL_TYPE

template <AsnInteger T>
struct AsnType<T> {
  static constexpr Tag kTag = kInteger;
};

template <typename T>
  requires std::is_enum_v<T>
struct AsnType<T> {
  static constexpr Tag kTag = kEnumerated;
};

template <HasAsnTag T>
struct AsnType<T> {
  static constexpr Tag kTag = T::kAsnTag;
};

// SEQUENCE OF.
template <AsnRepresentable T, typename Allocator>
struct AsnType<std::vector<T, Allocator>> {
  static constexpr Tag kTag = kSequence;
};

template <AsnRepresentable T, size_t N>
struct AsnType<std::array<T, N>> {
  static constexpr Tag kTag = kSequence;
};

template <AsnRepresentable T>
struct AsnType<absl::Span<T>> {
  static constexpr Tag kTag = kSequence;
};

// SET OF.
template <AsnRepresentable T, typename Compare, typename Allocator>
struct AsnType<std::set<T, Compare, Allocator>> {
  static constexpr Tag kTag = kSet;
};

template <typename T>
using SetOf = std::set<T>;

// Maps are encoded as a SEQUENCE of their entries. Only the mapped type has
// to be representable; how a key is written is up to the encoder.
template <typename K, AsnRepresentable V, typename Compare, typename Allocator>
struct AsnType<std::map<K, V, Compare, Allocator>> {
  static constexpr Tag kTag = kSequence;
};

template <typename K,
          AsnRepresentable V,
          typename Hash,
          typename Equal,
          typename Allocator>
struct AsnType<std::unordered_map<K, V, Hash, Equal, Allocator>> {
  static constexpr Tag kTag = kSequence;
};

template <typename K,
          AsnRepresentable V,
          typename Hash,
          typename Equal,
          typename Allocator>
struct AsnType<absl::flat_hash_map<K, V, Hash, Equal, Allocator>> {
  static constexpr Tag kTag = kSequence;
};

// An OPTIONAL component has the tag of its value when present.
template <AsnRepresentable T>
struct AsnType<absl::optional<T>> {
  static constexpr Tag kTag = kTagOf<T>;
};

// IsSequenceOf<T> is true for the types bound as SEQUENCE OF a
// representable element: std::vector, std::array and absl::Span. Sets and maps
// are not sequences of their elements.
template <typename T>
struct IsSequenceOf : std::false_type {};

template <AsnRepresentable T, typename Allocator>
struct IsSequenceOf<std::vector<T, Allocator>> : std::true_type {};

template <AsnRepresentable T, size_t N>
struct IsSequenceOf<std::array<T, N>> : std::true_type {};

template <AsnRepresentable T>
struct IsSequenceOf<absl::Span<T>> : std::true_type {};

template <typename T>
inline constexpr bool kIsSequenceOf =
    IsSequenceOf<std::remove_cvref_t<T>>::value;

}  // namespace asn1

#endif  // ASN1_TYPES_ASN_TYPE_H_
