// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/integer.h"

#include <stdint.h>

#include <limits>
#include <sstream>
#include <utility>

#include <gtest/gtest.h>

namespace asn1 {

namespace {

TEST(IntegerTest, DefaultIsZero) {
  Integer zero;
  EXPECT_TRUE(zero.is_zero());
  EXPECT_FALSE(zero.is_negative());
  EXPECT_EQ("0", zero.ToString());
  EXPECT_EQ(0, zero.ToInt64());
}

TEST(IntegerTest, FromInt64) {
  EXPECT_EQ("42", Integer(42).ToString());
  EXPECT_EQ("-42", Integer(-42).ToString());
  EXPECT_EQ("9223372036854775807",
            Integer(std::numeric_limits<int64_t>::max()).ToString());
  EXPECT_EQ("-9223372036854775808",
            Integer(std::numeric_limits<int64_t>::min()).ToString());
  EXPECT_TRUE(Integer(-1).is_negative());
}

TEST(IntegerTest, ToInt64) {
  const int64_t kValues[] = {0,
                             1,
                             -1,
                             255,
                             -256,
                             std::numeric_limits<int64_t>::max(),
                             std::numeric_limits<int64_t>::min()};
  for (int64_t value : kValues) {
    absl::optional<int64_t> round_trip = Integer(value).ToInt64();
    ASSERT_TRUE(round_trip) << value;
    EXPECT_EQ(value, *round_trip);
  }

  // One past either end of int64_t.
  EXPECT_FALSE(Integer::FromString("9223372036854775808")->ToInt64());
  EXPECT_FALSE(Integer::FromString("-9223372036854775809")->ToInt64());
}

TEST(IntegerTest, FromString) {
  absl::optional<Integer> big =
      Integer::FromString("123456789012345678901234567890");
  ASSERT_TRUE(big);
  EXPECT_EQ("123456789012345678901234567890", big->ToString());
  EXPECT_FALSE(big->ToInt64());

  absl::optional<Integer> negative = Integer::FromString("-17");
  ASSERT_TRUE(negative);
  EXPECT_EQ(Integer(-17), *negative);

  const char* const kInvalid[] = {"", "-", "+1", " 1", "1 ", "1.5", "0x10",
                                  "12a", "--1"};
  for (const char* text : kInvalid)
    EXPECT_FALSE(Integer::FromString(text)) << text;
}

TEST(IntegerTest, FromBytes) {
  const uint8_t kMagnitude[] = {0x01, 0x00, 0x00, 0x00, 0x00,
                                0x00, 0x00, 0x00, 0x00};
  Integer two_pow_64 = Integer::FromBytes(kMagnitude, false);
  EXPECT_EQ("18446744073709551616", two_pow_64.ToString());
  EXPECT_EQ("-18446744073709551616",
            Integer::FromBytes(kMagnitude, true).ToString());
}

TEST(IntegerTest, Ordering) {
  EXPECT_EQ(Integer(5), Integer(5));
  EXPECT_NE(Integer(5), Integer(-5));
  EXPECT_LT(Integer(-5), Integer(5));
  EXPECT_LT(Integer(std::numeric_limits<int64_t>::max()),
            *Integer::FromString("9223372036854775808"));
  EXPECT_GT(Integer(0), *Integer::FromString("-100000000000000000000"));
}

TEST(IntegerTest, CopyIsDeep) {
  Integer original(1000);
  Integer copy(original);
  EXPECT_EQ(original, copy);
  EXPECT_NE(original.bignum(), copy.bignum());

  Integer assigned;
  assigned = original;
  EXPECT_EQ(original, assigned);

  Integer moved(std::move(copy));
  EXPECT_EQ(original, moved);
}

TEST(IntegerTest, MoveTransfersBignum) {
  Integer original(77);
  const BIGNUM* bignum = original.bignum();
  Integer moved(std::move(original));
  EXPECT_EQ(bignum, moved.bignum());
  EXPECT_EQ(77, moved.ToInt64());

  Integer assigned;
  assigned = std::move(moved);
  EXPECT_EQ(bignum, assigned.bignum());
  // A moved-from Integer may be assigned to again.
  moved = Integer(5);
  EXPECT_EQ("5", moved.ToString());
}

TEST(IntegerTest, Stream) {
  std::ostringstream stream;
  stream << Integer(-3);
  EXPECT_EQ("-3", stream.str());
}

}  // namespace

}  // namespace asn1
