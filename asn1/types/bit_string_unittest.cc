// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/bit_string.h"

#include <sstream>
#include <vector>

#include <gtest/gtest.h>

#include "base/dcheck_is_on.h"

namespace asn1 {

namespace {

TEST(BitStringTest, Empty) {
  BitString empty;
  EXPECT_EQ(0u, empty.bit_length());
  EXPECT_EQ(0u, empty.unused_bits());
  EXPECT_FALSE(empty.AssertsBit(0));
}

TEST(BitStringTest, AssertsBit) {
  // 1011 0000 0100 0xxx
  BitString bits({0xB0, 0x40}, 3);
  EXPECT_EQ(13u, bits.bit_length());

  EXPECT_TRUE(bits.AssertsBit(0));
  EXPECT_FALSE(bits.AssertsBit(1));
  EXPECT_TRUE(bits.AssertsBit(2));
  EXPECT_TRUE(bits.AssertsBit(3));
  EXPECT_FALSE(bits.AssertsBit(4));
  EXPECT_TRUE(bits.AssertsBit(9));
  EXPECT_FALSE(bits.AssertsBit(12));

  // Past the end.
  EXPECT_FALSE(bits.AssertsBit(16));
  EXPECT_FALSE(bits.AssertsBit(1000));
}

TEST(BitStringTest, FromBools) {
  BitString bits = BitString::FromBools({true, false, true, true, false,
                                         false, false, false, false, true});
  EXPECT_EQ(10u, bits.bit_length());
  EXPECT_EQ(6u, bits.unused_bits());
  EXPECT_EQ((std::vector<uint8_t>{0xB0, 0x40}), bits.bytes());
  EXPECT_EQ(BitString({0xB0, 0x40}, 6), bits);

  BitString full = BitString::FromBools(std::vector<bool>(8, true));
  EXPECT_EQ(0u, full.unused_bits());
  EXPECT_EQ((std::vector<uint8_t>{0xFF}), full.bytes());
}

TEST(BitStringTest, Equality) {
  EXPECT_EQ(BitString({0x80}, 7), BitString({0x80}, 7));
  // Same bytes, different length.
  EXPECT_NE(BitString({0x80}, 7), BitString({0x80}, 6));
  EXPECT_NE(BitString({0x80}, 0), BitString({0x40}, 0));
}

TEST(BitStringTest, Stream) {
  std::ostringstream stream;
  stream << BitString({0xA0}, 4);
  EXPECT_EQ("1010", stream.str());
}

#if DCHECK_IS_ON()
TEST(BitStringDeathTest, NonZeroUnusedBits) {
  EXPECT_DEATH_IF_SUPPORTED(BitString({0x81}, 1), "");
}

TEST(BitStringDeathTest, UnusedBitsOutOfRange) {
  EXPECT_DEATH_IF_SUPPORTED(BitString({0x00}, 8), "");
}
#endif

}  // namespace

}  // namespace asn1
