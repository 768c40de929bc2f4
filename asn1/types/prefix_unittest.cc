// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/prefix.h"

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "asn1/types/character_string.h"

namespace asn1 {

namespace {

constexpr Tag kCtx0 = ContextSpecificTag(0);
constexpr Tag kCtx3 = ContextSpecificTag(3);

struct Unbound {
  int x = 0;
};

// The prefix replaces the inner tag, whatever it is.
static_assert(kTagOf<Implicit<kCtx0, bool>> == kCtx0);
static_assert(kTagOf<Implicit<kCtx0, std::vector<int>>> == kCtx0);
static_assert(kTagOf<Implicit<ApplicationTag(5), Unbound>> ==
              ApplicationTag(5));
static_assert(kTagOf<Implicit<kCtx3, Implicit<kCtx0, int>>> == kCtx3);

static_assert(kTagOf<Explicit<kCtx0, int>> == kCtx0);
static_assert(Explicit<kCtx0, int>::kInnerTag == kInteger);
static_assert(Explicit<kCtx3, SetOf<int>>::kInnerTag == kSet);
static_assert(Explicit<kCtx3, IA5String>::kInnerTag == kIA5String);
static_assert(Explicit<kCtx3, Explicit<kCtx0, bool>>::kInnerTag == kCtx0);

// Same value type, different tags: different types.
static_assert(!std::is_same_v<Implicit<kCtx0, int>, Implicit<kCtx3, int>>);
static_assert(!std::is_same_v<Implicit<kCtx0, int>, Explicit<kCtx0, int>>);

// Zero overhead.
static_assert(sizeof(Implicit<kCtx0, int64_t>) == sizeof(int64_t));
static_assert(sizeof(Explicit<kCtx0, int64_t>) == sizeof(int64_t));
static_assert(sizeof(Implicit<kCtx0, std::string>) == sizeof(std::string));
static_assert(sizeof(Explicit<kCtx0, std::string>) == sizeof(std::string));

static_assert(kTaggingOf<Implicit<kCtx0, int>> == TaggingMode::kImplicit);
static_assert(kTaggingOf<Explicit<kCtx0, int>> == TaggingMode::kExplicit);
static_assert(kTaggingOf<const IA5String&> == TaggingMode::kImplicit);
static_assert(kTaggingOf<int> == TaggingMode::kUntagged);
static_assert(kTaggingOf<std::string> == TaggingMode::kUntagged);

static_assert(std::is_same_v<Implicit<kCtx0, bool>::ValueType, bool>);

TEST(PrefixTest, ValueAccess) {
  Implicit<kCtx0, std::string> name("example");
  EXPECT_EQ("example", name.value());
  EXPECT_EQ("example", *name);
  EXPECT_EQ(7u, name->size());

  name->append(".com");
  EXPECT_EQ("example.com", name.value());

  Explicit<kCtx3, std::vector<int>> list(std::vector<int>{1, 2, 3});
  list->push_back(4);
  EXPECT_EQ(4u, list->size());
  EXPECT_EQ(4, (*list)[3]);
}

TEST(PrefixTest, DefaultConstructed) {
  Implicit<kCtx0, int> number;
  EXPECT_EQ(0, *number);
  Explicit<kCtx0, std::string> text;
  EXPECT_TRUE(text->empty());
}

TEST(PrefixTest, TakeValue) {
  Explicit<kCtx0, std::vector<int>> wrapped(std::vector<int>{1, 2});
  std::vector<int> taken = wrapped.TakeValue();
  EXPECT_EQ((std::vector<int>{1, 2}), taken);
}

TEST(PrefixTest, ComparisonFollowsValue) {
  using Version = Explicit<kCtx0, int>;
  EXPECT_EQ(Version(2), Version(2));
  EXPECT_NE(Version(1), Version(2));
  EXPECT_LT(Version(1), Version(2));
  EXPECT_GT(IA5String("b"), IA5String("a"));
}

TEST(PrefixTest, CharacterStrings) {
  EXPECT_EQ(kIA5String, kTagOf<IA5String>);
  EXPECT_EQ(kPrintableString, kTagOf<PrintableString>);
  EXPECT_EQ(kVisibleString, kTagOf<VisibleString>);
  EXPECT_EQ(kBmpString, kTagOf<BmpString>);
  EXPECT_EQ(kUniversalString, kTagOf<UniversalString>);
  EXPECT_EQ(kNumericString, kTagOf<NumericString>);
  EXPECT_EQ(kTeletexString, kTagOf<TeletexString>);
  EXPECT_EQ(kGeneralString, kTagOf<GeneralString>);
  EXPECT_EQ(kGraphicString, kTagOf<GraphicString>);
  EXPECT_EQ(kUtf8String, kTagOf<Utf8String>);

  PrintableString country("US");
  EXPECT_EQ("US", *country);
}

}  // namespace

}  // namespace asn1
