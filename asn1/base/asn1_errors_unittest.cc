// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/base/asn1_errors.h"

#include <gtest/gtest.h>

namespace asn1 {

namespace {

TEST(Asn1ErrorsTest, ErrorToString) {
  EXPECT_EQ("asn1::OK", ErrorToString(OK));
  EXPECT_EQ("asn1::ERR_INVALID_OID", ErrorToString(ERR_INVALID_OID));
  EXPECT_EQ("asn1::ERR_INVALID_OID_STRING",
            ErrorToString(ERR_INVALID_OID_STRING));
}

TEST(Asn1ErrorsTest, ErrorToShortString) {
  EXPECT_EQ("OK", ErrorToShortString(OK));
  EXPECT_EQ("ERR_INVALID_INTEGER_STRING",
            ErrorToShortString(ERR_INVALID_INTEGER_STRING));
}

TEST(Asn1ErrorsTest, ErrorsAreNegative) {
#define ASN1_ERROR(label, value) EXPECT_LT(ERR_##label, 0);
#include "asn1/base/asn1_error_list.h"
#undef ASN1_ERROR
}

}  // namespace

}  // namespace asn1
