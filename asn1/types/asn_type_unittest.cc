// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/asn_type.h"

#include <stdint.h>

#include <array>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <gtest/gtest.h>

#include "absl/container/flat_hash_map.h"
#include "absl/numeric/int128.h"
#include "absl/types/optional.h"
#include "absl/types/span.h"
#include "asn1/types/character_string.h"
#include "asn1/types/choice.h"
#include "asn1/types/instance_of.h"
#include "asn1/types/open.h"
#include "asn1/types/prefix.h"

namespace asn1 {

namespace {

enum class Color { kRed, kGreen };
enum LegacyFlag { kLegacyOn, kLegacyOff };

// A SEQUENCE declared the way generated code declares it.
struct Certificate {
  static constexpr Tag kAsnTag = kSequence;

  int64_t version;
  OctetString serial_number;
};

struct ApplicationMessage {
  static constexpr Tag kAsnTag = ApplicationTag(7);
};

// Not bound to any ASN.1 type.
struct Unbound {};

// A type that cannot be modified, bound by specialization.
struct ThirdPartyTimestamp {
  int64_t seconds;
};

}  // namespace

template <>
struct AsnType<ThirdPartyTimestamp> {
  static constexpr Tag kTag = kGeneralizedTime;
};

namespace {

// Every fixed-width integer is an INTEGER.
static_assert(kTagOf<int8_t> == kInteger);
static_assert(kTagOf<int16_t> == kInteger);
static_assert(kTagOf<int32_t> == kInteger);
static_assert(kTagOf<int64_t> == kInteger);
static_assert(kTagOf<uint8_t> == kInteger);
static_assert(kTagOf<uint16_t> == kInteger);
static_assert(kTagOf<uint32_t> == kInteger);
static_assert(kTagOf<uint64_t> == kInteger);
static_assert(kTagOf<long long> == kInteger);
static_assert(kTagOf<unsigned long> == kInteger);
static_assert(kTagOf<absl::int128> == kInteger);
static_assert(kTagOf<absl::uint128> == kInteger);
static_assert(kTagOf<Integer> == kInteger);

// Character types and bool are not integers.
static_assert(kTagOf<bool> == kBool);
static_assert(!AsnRepresentable<char>);
static_assert(!AsnRepresentable<char16_t>);
static_assert(!AsnRepresentable<wchar_t>);

static_assert(kTagOf<OctetString> == kOctetString);
static_assert(kTagOf<BitString> == kBitString);
static_assert(kTagOf<Null> == kNull);
static_assert(kTagOf<ObjectIdentifier> == kOid);
static_assert(kTagOf<ConstOid> == kOid);
static_assert(kTagOf<std::string> == kUtf8String);
static_assert(kTagOf<Utf8String> == kUtf8String);
static_assert(kTagOf<absl::string_view> == kUtf8String);
static_assert(kTagOf<UtcTime> == kUtcTime);
static_assert(kTagOf<GeneralizedTime> == kGeneralizedTime);

// cv and reference qualifiers do not change the tag.
static_assert(kTagOf<const int&> == kInteger);
static_assert(kTagOf<const std::string> == kUtf8String);

static_assert(kTagOf<Color> == kEnumerated);
static_assert(kTagOf<LegacyFlag> == kEnumerated);

static_assert(kTagOf<Certificate> == kSequence);
static_assert(kTagOf<ApplicationMessage> == ApplicationTag(7));
static_assert(kTagOf<ThirdPartyTimestamp> == kGeneralizedTime);
static_assert(kTagOf<InstanceOf<Open>> == kExternal);
static_assert(kTagOf<InstanceOf<int>> == kExternal);

static_assert(!AsnRepresentable<Unbound>);
static_assert(!AsnRepresentable<void*>);
static_assert(!AsnRepresentable<float>);
static_assert(!AsnRepresentable<const char*>);

// Collections.
static_assert(kTagOf<std::vector<int>> == kSequence);
static_assert(kTagOf<std::vector<bool>> == kSequence);
static_assert(kTagOf<std::array<Certificate, 3>> == kSequence);
static_assert(kTagOf<absl::Span<const OctetString>> == kSequence);
static_assert(kTagOf<std::vector<std::vector<std::string>>> == kSequence);
static_assert(kTagOf<SetOf<int>> == kSet);
static_assert(kTagOf<std::set<ObjectIdentifier>> == kSet);
static_assert(kTagOf<std::map<std::string, int>> == kSequence);
static_assert(kTagOf<std::map<Unbound*, int>> == kSequence);
static_assert(kTagOf<std::unordered_map<int, OctetString>> == kSequence);
static_assert(kTagOf<absl::flat_hash_map<std::string, bool>> == kSequence);

// A collection is representable only if its elements are.
static_assert(!AsnRepresentable<std::vector<Unbound>>);
static_assert(!AsnRepresentable<SetOf<float>>);
static_assert(!AsnRepresentable<std::map<int, Unbound>>);

// OPTIONAL keeps the tag of the value.
static_assert(kTagOf<absl::optional<int>> == kInteger);
static_assert(kTagOf<absl::optional<std::string>> == kUtf8String);
static_assert(kTagOf<absl::optional<SetOf<int>>> == kSet);
static_assert(kTagOf<absl::optional<IA5String>> == kIA5String);
static_assert(!AsnRepresentable<absl::optional<Unbound>>);

// IsSequenceOf.
static_assert(kIsSequenceOf<std::vector<int>>);
static_assert(kIsSequenceOf<std::array<bool, 2>>);
static_assert(kIsSequenceOf<absl::Span<const int>>);
static_assert(kIsSequenceOf<const std::vector<std::string>&>);
static_assert(!kIsSequenceOf<SetOf<int>>);
static_assert(!kIsSequenceOf<std::map<int, int>>);
static_assert(!kIsSequenceOf<int>);
static_assert(!kIsSequenceOf<Certificate>);
static_assert(!kIsSequenceOf<std::vector<Unbound>>);

template <typename T>
void ExpectIntegerTag() {
  EXPECT_EQ(kInteger, AsnType<T>::kTag);
}

TEST(AsnTypeTest, IntegersOfAnyWidth) {
  ExpectIntegerTag<signed char>();
  ExpectIntegerTag<short>();
  ExpectIntegerTag<int>();
  ExpectIntegerTag<long>();
  ExpectIntegerTag<long long>();
  ExpectIntegerTag<unsigned char>();
  ExpectIntegerTag<unsigned short>();
  ExpectIntegerTag<unsigned int>();
  ExpectIntegerTag<unsigned long>();
  ExpectIntegerTag<unsigned long long>();
}

TEST(AsnTypeTest, SetOfAndSequenceOfDiffer) {
  EXPECT_EQ(kSet, kTagOf<SetOf<OctetString>>);
  EXPECT_EQ(kSequence, kTagOf<std::vector<OctetString>>);
  EXPECT_NE(kTagOf<SetOf<OctetString>>, kTagOf<std::vector<OctetString>>);
}

TEST(AsnTypeTest, OptionalFollowsValue) {
  EXPECT_EQ(kTagOf<Certificate>, kTagOf<absl::optional<Certificate>>);
  EXPECT_EQ(kTagOf<Null>, kTagOf<absl::optional<Null>>);
  EXPECT_EQ(kTagOf<std::vector<int>>,
            kTagOf<absl::optional<std::vector<int>>>);
}

TEST(AsnTypeTest, ChoiceAndOpenHaveNoTag) {
  using Time = Choice<UtcTime, GeneralizedTime>;
  EXPECT_EQ(kNone, kTagOf<Time>);
  EXPECT_EQ(kNone, kTagOf<Open>);
  EXPECT_EQ(kNone, kTagOf<absl::optional<Time>>);
  // kNone is not the tag of any type bound above.
  EXPECT_NE(kNone, kTagOf<bool>);
  EXPECT_NE(kNone, kTagOf<Null>);
}

}  // namespace

}  // namespace asn1
