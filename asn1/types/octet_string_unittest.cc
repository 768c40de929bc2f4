// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/octet_string.h"

#include <set>
#include <sstream>
#include <vector>

#include <gtest/gtest.h>

namespace asn1 {

namespace {

TEST(OctetStringTest, Construction) {
  EXPECT_TRUE(OctetString().empty());

  const uint8_t kBytes[] = {0xDE, 0xAD, 0xBE, 0xEF};
  OctetString from_array(kBytes);
  EXPECT_EQ(4u, from_array.size());
  EXPECT_EQ((std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}), from_array.bytes());
  EXPECT_EQ(from_array, OctetString(std::vector<uint8_t>(kBytes, kBytes + 4)));

  OctetString from_text("abc");
  EXPECT_EQ("abc", from_text.AsString());
  EXPECT_EQ(3u, from_text.AsSpan().size());
  EXPECT_EQ('b', from_text.AsSpan()[1]);
}

TEST(OctetStringTest, EmbeddedNul) {
  OctetString value(absl::string_view("a\0b", 3));
  EXPECT_EQ(3u, value.size());
  EXPECT_EQ(0, value.bytes()[1]);
}

TEST(OctetStringTest, Ordering) {
  EXPECT_LT(OctetString("a"), OctetString("b"));
  EXPECT_LT(OctetString("a"), OctetString("ab"));
  EXPECT_LT(OctetString(), OctetString("a"));

  std::set<OctetString> set = {OctetString("b"), OctetString("a"),
                               OctetString("a")};
  EXPECT_EQ(2u, set.size());
}

TEST(OctetStringTest, StreamsAsHex) {
  const uint8_t kBytes[] = {0x00, 0x1f, 0xab};
  std::ostringstream stream;
  stream << OctetString(kBytes);
  EXPECT_EQ("001FAB", stream.str());
}

}  // namespace

}  // namespace asn1
