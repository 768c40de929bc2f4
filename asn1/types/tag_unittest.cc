// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/tag.h"

#include <set>
#include <sstream>

#include <gtest/gtest.h>

namespace asn1 {

namespace {

// Tags are usable in constant expressions.
static_assert(kInteger == Tag{TagClass::kUniversal, 2});
static_assert(kSequence.number == 16 && kSet.number == 17);
static_assert(ContextSpecificTag(0) != kEndOfContents);
static_assert(IsUniversal(kUtf8String));
static_assert(!IsUniversal(ApplicationTag(1)));
static_assert(kNone == kEndOfContents);

TEST(TagTest, UniversalNumbersMatchX680) {
  EXPECT_EQ(1u, kBool.number);
  EXPECT_EQ(2u, kInteger.number);
  EXPECT_EQ(3u, kBitString.number);
  EXPECT_EQ(4u, kOctetString.number);
  EXPECT_EQ(5u, kNull.number);
  EXPECT_EQ(6u, kOid.number);
  EXPECT_EQ(8u, kExternal.number);
  EXPECT_EQ(10u, kEnumerated.number);
  EXPECT_EQ(12u, kUtf8String.number);
  EXPECT_EQ(16u, kSequence.number);
  EXPECT_EQ(17u, kSet.number);
  EXPECT_EQ(19u, kPrintableString.number);
  EXPECT_EQ(22u, kIA5String.number);
  EXPECT_EQ(23u, kUtcTime.number);
  EXPECT_EQ(24u, kGeneralizedTime.number);
  EXPECT_EQ(26u, kVisibleString.number);
  EXPECT_EQ(28u, kUniversalString.number);
  EXPECT_EQ(30u, kBmpString.number);
  EXPECT_EQ(34u, kDuration.number);
}

TEST(TagTest, UniversalTagsAreDistinct) {
  std::set<Tag> tags;
#define ASN1_UNIVERSAL_TAG(label, value, name) \
  EXPECT_TRUE(tags.insert(k##label).second) << #label;
#include "asn1/types/universal_tag_list.h"
#undef ASN1_UNIVERSAL_TAG
}

TEST(TagTest, EqualityIsStructural) {
  EXPECT_EQ(ContextSpecificTag(3), (Tag{TagClass::kContextSpecific, 3}));
  EXPECT_NE(ContextSpecificTag(3), ApplicationTag(3));
  EXPECT_NE(ContextSpecificTag(3), PrivateTag(3));
  EXPECT_NE(ContextSpecificTag(3), ContextSpecificTag(4));
  // Same number, different class.
  EXPECT_NE(kInteger, ContextSpecificTag(2));
}

TEST(TagTest, Ordering) {
  EXPECT_LT(kBool, kInteger);
  EXPECT_LT(kDuration, ApplicationTag(0));
  EXPECT_LT(ApplicationTag(100), ContextSpecificTag(0));
  EXPECT_LT(ContextSpecificTag(100), PrivateTag(0));
}

TEST(TagTest, NoneIsNotATypeTag) {
  EXPECT_EQ(0u, kNone.number);
  EXPECT_TRUE(IsUniversal(kNone));
  EXPECT_STREQ("END-OF-CONTENTS", UniversalTagName(kNone.number));
}

TEST(TagTest, UniversalTagName) {
  EXPECT_STREQ("BOOLEAN", UniversalTagName(1));
  EXPECT_STREQ("OBJECT IDENTIFIER", UniversalTagName(kOid.number));
  EXPECT_STREQ("UTCTime", UniversalTagName(kUtcTime.number));
  EXPECT_STREQ("BMPString", UniversalTagName(kBmpString.number));
  EXPECT_EQ(nullptr, UniversalTagName(15));
  EXPECT_EQ(nullptr, UniversalTagName(35));
}

TEST(TagTest, TagToString) {
  EXPECT_EQ("[UNIVERSAL 2]", TagToString(kInteger));
  EXPECT_EQ("[APPLICATION 3]", TagToString(ApplicationTag(3)));
  EXPECT_EQ("[PRIVATE 1]", TagToString(PrivateTag(1)));
  EXPECT_EQ("[0]", TagToString(ContextSpecificTag(0)));

  std::ostringstream stream;
  stream << ContextSpecificTag(7) << " " << TagClass::kApplication;
  EXPECT_EQ("[7] APPLICATION", stream.str());
}

}  // namespace

}  // namespace asn1
