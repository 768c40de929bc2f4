// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_TAG_H_
#define ASN1_TYPES_TAG_H_

#include <stdint.h>

#include <compare>
#include <iosfwd>
#include <string>

#include "asn1/base/asn1_export.h"

namespace asn1 {

// The four ASN.1 tag classes. The numeric values match the two class bits of
// an X.690 identifier octet.
enum class TagClass : uint8_t {
  kUniversal = 0,
  kApplication = 1,
  kContextSpecific = 2,
  kPrivate = 3,
};

// The closed set of tag numbers X.680 assigns in the UNIVERSAL class.
enum class UniversalTagNumber : uint32_t {
#define ASN1_UNIVERSAL_TAG(label, value, name) k##label = value,
#include "asn1/types/universal_tag_list.h"
#undef ASN1_UNIVERSAL_TAG
};

// This Tag type represents the identifier of an ASN.1 type: a class and a
// tag number. Unlike a DER identifier octet it carries no
// primitive/constructed bit; that is a property of an encoding, not of a
// type.
//
// Tag is a structural literal type, so a Tag value can be used as a non-type
// template argument (see Implicit and Explicit in asn1/types/prefix.h).
struct Tag {
  TagClass tag_class;
  uint32_t number;

  friend constexpr bool operator==(const Tag&, const Tag&) = default;
  friend constexpr auto operator<=>(const Tag&, const Tag&) = default;
};

constexpr Tag UniversalTag(UniversalTagNumber number) {
  return Tag{TagClass::kUniversal, static_cast<uint32_t>(number)};
}

// Creates the tag written in ASN.1 notation as
//     [APPLICATION number]
constexpr Tag ApplicationTag(uint32_t number) {
  return Tag{TagClass::kApplication, number};
}

// Creates the tag written in ASN.1 notation as
//     [number]
// This is the class used to disambiguate fields of a SEQUENCE, SET or CHOICE.
constexpr Tag ContextSpecificTag(uint32_t number) {
  return Tag{TagClass::kContextSpecific, number};
}

// Creates the tag written in ASN.1 notation as
//     [PRIVATE number]
constexpr Tag PrivateTag(uint32_t number) {
  return Tag{TagClass::kPrivate, number};
}

// Universal class tags: kBool, kInteger, kBitString, kOctetString, kNull,
// kOid, kUtf8String, kSequence, kSet, kUtcTime, kGeneralizedTime, ...
#define ASN1_UNIVERSAL_TAG(label, value, name) \
  inline constexpr Tag k##label = UniversalTag(UniversalTagNumber::k##label);
#include "asn1/types/universal_tag_list.h"
#undef ASN1_UNIVERSAL_TAG

// The tag declared by types whose wire tag is not fixed, such as CHOICE and
// open types. The encoder must inspect the value to learn the tag.
//
// UNIVERSAL 0 is reserved by X.680 for the encoding rules, so no ASN.1 type
// is ever assigned it and kNone cannot collide with the tag of a real type.
// It does share its value with the end-of-contents marker of indefinite
// length encodings, so an encoder must never emit kNone as an identifier.
inline constexpr Tag kNone = kEndOfContents;

constexpr bool IsUniversal(const Tag& tag) {
  return tag.tag_class == TagClass::kUniversal;
}

// Returns "UNIVERSAL", "APPLICATION", "CONTEXT-SPECIFIC" or "PRIVATE".
ASN1_EXPORT const char* TagClassToString(TagClass tag_class);

// Returns the X.680 type name for a UNIVERSAL tag number, such as "INTEGER",
// or nullptr when the number is not assigned.
ASN1_EXPORT const char* UniversalTagName(uint32_t number);

// Formats |tag| in ASN.1 notation: "[UNIVERSAL 2]", "[APPLICATION 3]",
// "[PRIVATE 1]", or "[0]" for the context-specific class.
ASN1_EXPORT std::string TagToString(const Tag& tag);

ASN1_EXPORT std::ostream& operator<<(std::ostream& os, TagClass tag_class);
ASN1_EXPORT std::ostream& operator<<(std::ostream& os, const Tag& tag);

}  // namespace asn1

#endif  // ASN1_TYPES_TAG_H_
