// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/known_oids.h"

#include <gtest/gtest.h>

namespace asn1 {

namespace {

static_assert(ValidateOidArcs(kOidRsaEncryption.arcs()) == OK);
static_assert(ValidateOidArcs(kOidSha256.arcs()) == OK);
static_assert(kOidCommonName < kOidCountryName);
static_assert(kOidRsaEncryption != kOidSha256WithRsaEncryption);

TEST(KnownOidsTest, DottedForms) {
  EXPECT_EQ("1.2.840.113549.1.1.1", kOidRsaEncryption.ToString());
  EXPECT_EQ("1.2.840.113549.1.1.11", kOidSha256WithRsaEncryption.ToString());
  EXPECT_EQ("1.2.840.10045.2.1", kOidEcPublicKey.ToString());
  EXPECT_EQ("2.16.840.1.101.3.4.2.1", kOidSha256.ToString());
  EXPECT_EQ("2.5.4.3", kOidCommonName.ToString());
  EXPECT_EQ("2.5.29.19", kOidBasicConstraints.ToString());
}

TEST(KnownOidsTest, GetOidName) {
  EXPECT_EQ("commonName", GetOidName(kOidCommonName));
  EXPECT_EQ("rsaEncryption", GetOidName(kOidRsaEncryption));
  EXPECT_EQ("iso", GetOidName(kOidIso));

  absl::optional<ObjectIdentifier> san =
      ObjectIdentifier::FromString("2.5.29.17");
  ASSERT_TRUE(san);
  EXPECT_EQ("subjectAltName", GetOidName(*san));

  absl::optional<ObjectIdentifier> unknown =
      ObjectIdentifier::FromString("1.3.6.1.4.1.11129");
  ASSERT_TRUE(unknown);
  EXPECT_TRUE(GetOidName(*unknown).empty());
}

TEST(KnownOidsTest, Roots) {
  EXPECT_TRUE(ObjectIdentifier(kOidRsaEncryption).StartsWith(kOidIso));
  EXPECT_TRUE(ObjectIdentifier(kOidCommonName).StartsWith(kOidJointIsoItuT));
  EXPECT_FALSE(ObjectIdentifier(kOidCommonName).StartsWith(kOidItuT));
}

}  // namespace

}  // namespace asn1
