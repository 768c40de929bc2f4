// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/open.h"

#include <stdint.h>

#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "asn1/types/known_oids.h"

namespace asn1 {

namespace {

static_assert(kTagOf<Open> == kNone);

TEST(OpenTest, DefaultIsNull) {
  Open open;
  EXPECT_TRUE(open.Is<Null>());
  EXPECT_EQ(kNull, open.tag());
}

TEST(OpenTest, TagOfHeldValue) {
  EXPECT_EQ(kBool, Open(true).tag());
  EXPECT_EQ(kInteger, Open(Integer(42)).tag());
  EXPECT_EQ(kOctetString, Open(OctetString("abc")).tag());
  EXPECT_EQ(kBitString, Open(BitString::FromBools({true, false})).tag());
  EXPECT_EQ(kOid, Open(ObjectIdentifier(kOidCommonName)).tag());
  EXPECT_EQ(kUtf8String, Open(Utf8String("text")).tag());
  EXPECT_EQ(kIA5String, Open(IA5String("user@example.com")).tag());
  EXPECT_EQ(kPrintableString, Open(PrintableString("US")).tag());
  EXPECT_EQ(kVisibleString, Open(VisibleString("v")).tag());
  EXPECT_EQ(kBmpString, Open(BmpString("b")).tag());
  EXPECT_EQ(kUniversalString, Open(UniversalString("u")).tag());
  EXPECT_EQ(kUtcTime, Open(UtcTime()).tag());
  EXPECT_EQ(kGeneralizedTime, Open(GeneralizedTime()).tag());
}

TEST(OpenTest, UnknownValueKeepsItsTag) {
  Open unknown(UnknownValue{PrivateTag(9), OctetString("\x01\x02")});
  EXPECT_EQ(PrivateTag(9), unknown.tag());
  ASSERT_TRUE(unknown.GetIf<UnknownValue>());
  EXPECT_EQ(2u, unknown.GetIf<UnknownValue>()->contents.size());
}

TEST(OpenTest, GetIf) {
  Open open(Utf8String("hello"));
  ASSERT_TRUE(open.GetIf<Utf8String>());
  EXPECT_EQ("hello", *open.GetIf<Utf8String>());
  EXPECT_FALSE(open.GetIf<IA5String>());
  EXPECT_FALSE(open.GetInstanceOf());
}

TEST(OpenTest, InstanceOf) {
  Open open(InstanceOf<Open>{ObjectIdentifier(kOidEmailAddress),
                             Open(IA5String("user@example.com"))});
  EXPECT_EQ(kExternal, open.tag());

  const InstanceOf<Open>* instance = open.GetInstanceOf();
  ASSERT_TRUE(instance);
  EXPECT_EQ(kOidEmailAddress, instance->type_id);
  EXPECT_EQ(kIA5String, instance->value.tag());
}

TEST(OpenTest, CopyIsDeep) {
  Open original(InstanceOf<Open>{ObjectIdentifier(kOidCommonName),
                                 Open(Utf8String("name"))});
  Open copy(original);
  ASSERT_TRUE(copy.GetInstanceOf());
  EXPECT_NE(original.GetInstanceOf(), copy.GetInstanceOf());
  EXPECT_EQ(original, copy);

  Open assigned;
  assigned = copy;
  EXPECT_EQ(original, assigned);
  EXPECT_NE(copy.GetInstanceOf(), assigned.GetInstanceOf());

  Open moved(std::move(copy));
  EXPECT_EQ(original, moved);
}

TEST(OpenTest, MovedFromHoldsNull) {
  Open original(InstanceOf<Open>{ObjectIdentifier(kOidCommonName),
                                 Open(true)});
  Open moved(std::move(original));
  EXPECT_EQ(kExternal, moved.tag());

  // The moved-from value stays usable: it can be inspected, compared and
  // copied.
  EXPECT_TRUE(original.Is<Null>());
  EXPECT_FALSE(original.GetInstanceOf());
  EXPECT_EQ(kNull, original.tag());
  EXPECT_EQ(Open(), original);
  Open copy(original);
  EXPECT_EQ(Open(), copy);

  Open assigned;
  assigned = std::move(moved);
  ASSERT_TRUE(assigned.GetInstanceOf());
  EXPECT_TRUE(moved.Is<Null>());
  Open copy_assigned;
  copy_assigned = moved;
  EXPECT_EQ(Open(), copy_assigned);
}

TEST(OpenTest, Equality) {
  EXPECT_EQ(Open(Integer(7)), Open(Integer(7)));
  EXPECT_NE(Open(Integer(7)), Open(Integer(8)));
  EXPECT_EQ(Open(), Open(Null()));
  // Same text under a different tag.
  EXPECT_NE(Open(Utf8String("a")), Open(IA5String("a")));

  Open a(InstanceOf<Open>{ObjectIdentifier(kOidCommonName), Open(true)});
  Open b(InstanceOf<Open>{ObjectIdentifier(kOidCommonName), Open(false)});
  Open c(InstanceOf<Open>{ObjectIdentifier(kOidCountryName), Open(true)});
  EXPECT_NE(a, b);
  EXPECT_NE(a, c);
}

}  // namespace

}  // namespace asn1
