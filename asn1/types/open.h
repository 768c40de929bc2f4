// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_OPEN_H_
#define ASN1_TYPES_OPEN_H_

#include <memory>
#include <type_traits>
#include <utility>

#include "absl/types/variant.h"
#include "asn1/base/asn1_export.h"
#include "asn1/types/asn_type.h"
#include "asn1/types/character_string.h"
#include "asn1/types/instance_of.h"
#include "asn1/types/tag.h"

namespace asn1 {

// A value of a type that is not one of the kinds Open knows about: its tag
// and the raw contents octets, kept so the value can be passed through.
struct ASN1_EXPORT UnknownValue {
  Tag tag;
  OctetString contents;

  friend bool operator==(const UnknownValue&, const UnknownValue&) = default;
};

class Open;

namespace internal {

template <typename T, typename Variant>
struct IsVariantAlternative;

template <typename T, typename... Ts>
struct IsVariantAlternative<T, absl::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

}  // namespace internal

// The value of an open type (ANY, or a component constrained by an
// information object class) whose type is only known at runtime. It holds one
// of the universal kinds below, an INSTANCE OF another open value, or an
// UnknownValue.
//
// Like a CHOICE, an open type has no tag of its own: kAsnTag is kNone and
// tag() reports the tag of the held value. Copies are deep.
class ASN1_EXPORT Open {
 public:
  static constexpr Tag kAsnTag = kNone;

  using Value = absl::variant<Null,
                              bool,
                              Integer,
                              BitString,
                              OctetString,
                              ObjectIdentifier,
                              Utf8String,
                              IA5String,
                              PrintableString,
                              VisibleString,
                              BmpString,
                              UniversalString,
                              UtcTime,
                              GeneralizedTime,
                              std::unique_ptr<InstanceOf<Open>>,
                              UnknownValue>;

  // Holds NULL.
  Open();

  template <typename T>
    requires(internal::IsVariantAlternative<std::remove_cvref_t<T>,
                                            Value>::value &&
             !std::is_same_v<std::remove_cvref_t<T>,
                             std::unique_ptr<InstanceOf<Open>>>)
  explicit Open(T&& value)
      : value_(absl::in_place_type<std::remove_cvref_t<T>>,
               std::forward<T>(value)) {}

  explicit Open(InstanceOf<Open> instance);

  Open(const Open& other);
  // Leaves |other| holding NULL.
  Open(Open&& other) noexcept;
  Open& operator=(const Open& other);
  Open& operator=(Open&& other) noexcept;
  ~Open();

  // Returns the tag of the held value: kExternal for an INSTANCE OF, the
  // recorded tag for an UnknownValue.
  Tag tag() const;

  template <typename T>
  bool Is() const {
    return absl::holds_alternative<T>(value_);
  }

  // Returns the held value if it is a T, otherwise nullptr. Use
  // GetInstanceOf() for INSTANCE OF values.
  template <typename T>
  const T* GetIf() const {
    return absl::get_if<T>(&value_);
  }

  // Returns the held INSTANCE OF, or nullptr.
  const InstanceOf<Open>* GetInstanceOf() const;

  friend ASN1_EXPORT bool operator==(const Open& lhs, const Open& rhs);

 private:
  // Never holds a null InstanceOf pointer.
  Value value_;
};

}  // namespace asn1

#endif  // ASN1_TYPES_OPEN_H_
