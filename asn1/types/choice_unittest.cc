// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/choice.h"

#include <stdint.h>

#include <string>

#include <gtest/gtest.h>

#include "asn1/types/character_string.h"
#include "asn1/types/open.h"
#include "asn1/types/prefix.h"

namespace asn1 {

namespace {

using Time = Choice<UtcTime, GeneralizedTime>;

// DirectoryString ::= CHOICE {
//   teletexString     TeletexString,
//   printableString   PrintableString,
//   universalString   UniversalString,
//   utf8String        UTF8String,
//   bmpString         BMPString }
using DirectoryString = Choice<TeletexString,
                               PrintableString,
                               UniversalString,
                               Utf8String,
                               BmpString>;

// Two INTEGER alternatives told apart by context tags.
using Version = Choice<Implicit<ContextSpecificTag(0), int64_t>,
                       Implicit<ContextSpecificTag(1), int64_t>>;

// A CHOICE containing a CHOICE.
using Nested = Choice<bool, Time>;

static_assert(kTagOf<Time> == kNone);
static_assert(kTagOf<DirectoryString> == kNone);
static_assert(kTagOf<Nested> == kNone);

static_assert(internal::HasDistinctTags<bool, int, std::string>());
static_assert(!internal::HasDistinctTags<int, int64_t>());
static_assert(!internal::HasDistinctTags<std::string, absl::string_view>());
static_assert(
    !internal::HasDistinctTags<Implicit<kBool, std::string>, bool>());
// Untagged alternatives are only known at runtime.
static_assert(internal::HasDistinctTags<Time, Open, bool>());

TEST(ChoiceTest, DefaultHoldsFirstAlternative) {
  Time time;
  EXPECT_EQ(0u, time.index());
  EXPECT_TRUE(time.Is<UtcTime>());
  EXPECT_EQ(kUtcTime, time.active_tag());
}

TEST(ChoiceTest, ActiveTag) {
  GeneralizedTime generalized;
  generalized.year = 2051;
  Time time(generalized);
  EXPECT_EQ(1u, time.index());
  EXPECT_EQ(kGeneralizedTime, time.active_tag());
  ASSERT_TRUE(time.GetIf<GeneralizedTime>());
  EXPECT_EQ(2051, time.GetIf<GeneralizedTime>()->year);
  EXPECT_FALSE(time.GetIf<UtcTime>());

  DirectoryString name(PrintableString("Example CA"));
  EXPECT_EQ(kPrintableString, name.active_tag());
  DirectoryString utf8(Utf8String("Example"));
  EXPECT_EQ(kUtf8String, utf8.active_tag());

  Version version(Implicit<ContextSpecificTag(1), int64_t>(3));
  EXPECT_EQ(ContextSpecificTag(1), version.active_tag());
}

TEST(ChoiceTest, NestedChoiceReportsInnerTag) {
  Nested boolean(true);
  EXPECT_EQ(kBool, boolean.active_tag());

  Nested time(Time(UtcTime{2024, 1, 2, 3, 4, 5}));
  EXPECT_EQ(kUtcTime, time.active_tag());
  EXPECT_NE(kNone, time.active_tag());
}

TEST(ChoiceTest, OpenAlternative) {
  using Any = Choice<bool, Open>;
  Any any(Open(ObjectIdentifier::FromString("1.2.3").value()));
  EXPECT_EQ(kOid, any.active_tag());
}

TEST(ChoiceTest, Equality) {
  EXPECT_EQ(DirectoryString(PrintableString("a")),
            DirectoryString(PrintableString("a")));
  EXPECT_NE(DirectoryString(PrintableString("a")),
            DirectoryString(PrintableString("b")));
  // Same text, different alternative.
  EXPECT_NE(DirectoryString(PrintableString("a")),
            DirectoryString(Utf8String("a")));
}

TEST(ChoiceTest, Mutation) {
  DirectoryString name(Utf8String("old"));
  name.GetIf<Utf8String>()->assign("new");
  EXPECT_EQ("new", *name.GetIf<Utf8String>());
}

}  // namespace

}  // namespace asn1
