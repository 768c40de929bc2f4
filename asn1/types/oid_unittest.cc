// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/oid.h"

#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include <gtest/gtest.h>

#include "base/logging.h"

namespace asn1 {

namespace {

constexpr uint32_t kRsadsiArcs[] = {1, 2, 840, 113549};
constexpr ConstOid kRsadsi(kRsadsiArcs);
constexpr uint32_t kShortArcs[] = {1, 2};
constexpr uint32_t kLongArcs[] = {1, 2, 1};

static_assert(ValidateOidArcs(kRsadsiArcs) == OK);
static_assert(kRsadsi.size() == 4);
static_assert(kRsadsi[2] == 840);
static_assert(ConstOid(kShortArcs) < ConstOid(kLongArcs));
static_assert(ConstOid(kRsadsiArcs) == kRsadsi);

// ConstOid is usable as a non-type template argument.
template <ConstOid kOid>
struct OidTagged {
  static constexpr size_t kArcCount = kOid.size();
  static std::string Name() { return kOid.ToString(); }
};

static_assert(OidTagged<kRsadsi>::kArcCount == 4);
static_assert(std::is_same_v<OidTagged<kRsadsi>,
                             OidTagged<ConstOid(kRsadsiArcs)>>);
static_assert(!std::is_same_v<OidTagged<kRsadsi>,
                              OidTagged<ConstOid(kShortArcs)>>);

std::string* g_last_log_body = nullptr;

bool CaptureLog(int severity,
                const char* file,
                int line,
                size_t message_start,
                const std::string& str) {
  *g_last_log_body = str.substr(message_start);
  return true;
}

TEST(OidTest, TemplateArgument) {
  EXPECT_EQ("1.2.840.113549", OidTagged<kRsadsi>::Name());
  EXPECT_EQ("1.2", OidTagged<ConstOid(kShortArcs)>::Name());
}

TEST(OidTest, ValidateArcs) {
  EXPECT_EQ(OK, ValidateOidArcs(std::vector<uint32_t>{1, 2, 840, 113549}));
  EXPECT_EQ(OK, ValidateOidArcs(std::vector<uint32_t>{0}));
  EXPECT_EQ(OK, ValidateOidArcs(std::vector<uint32_t>{2}));
  EXPECT_EQ(OK, ValidateOidArcs(std::vector<uint32_t>{0, 39}));
  EXPECT_EQ(OK, ValidateOidArcs(std::vector<uint32_t>{1, 39, 5}));
  // Under joint-iso-itu-t the second arc is unbounded.
  EXPECT_EQ(OK, ValidateOidArcs(std::vector<uint32_t>{2, 999, 3}));

  EXPECT_EQ(ERR_INVALID_OID, ValidateOidArcs({}));
  EXPECT_EQ(ERR_INVALID_OID, ValidateOidArcs(std::vector<uint32_t>{3}));
  EXPECT_EQ(ERR_INVALID_OID, ValidateOidArcs(std::vector<uint32_t>{3, 1, 2}));
  EXPECT_EQ(ERR_INVALID_OID, ValidateOidArcs(std::vector<uint32_t>{0, 40}));
  EXPECT_EQ(ERR_INVALID_OID, ValidateOidArcs(std::vector<uint32_t>{1, 40}));
}

TEST(OidTest, Create) {
  absl::optional<ObjectIdentifier> oid =
      ObjectIdentifier::Create({1, 2, 840, 113549});
  ASSERT_TRUE(oid);
  EXPECT_EQ((std::vector<uint32_t>{1, 2, 840, 113549}), oid->arcs());
  EXPECT_EQ(4u, oid->size());

  EXPECT_FALSE(ObjectIdentifier::Create({3, 1}));
  EXPECT_FALSE(ObjectIdentifier::Create({0, 40}));
  EXPECT_FALSE(ObjectIdentifier::Create({}));
}

TEST(OidTest, CreateFailureIsLogged) {
  std::string body;
  g_last_log_body = &body;
  int old_min_log_level = logging::GetMinLogLevel();
  logging::LogMessageHandlerFunction old_handler =
      logging::GetLogMessageHandler();
  logging::SetMinLogLevel(-1);
  logging::SetLogMessageHandler(&CaptureLog);

  EXPECT_FALSE(ObjectIdentifier::Create({0, 40}));

  logging::SetLogMessageHandler(old_handler);
  logging::SetMinLogLevel(old_min_log_level);
  g_last_log_body = nullptr;

#if DCHECK_IS_ON()
  EXPECT_EQ("asn1::ERR_INVALID_OID: 0.40\n", body);
#else
  EXPECT_TRUE(body.empty());
#endif
}

TEST(OidTest, ParseOidString) {
  std::vector<uint32_t> arcs;
  EXPECT_EQ(OK, ParseOidString("1.2.840.113549.1.1.11", &arcs));
  EXPECT_EQ((std::vector<uint32_t>{1, 2, 840, 113549, 1, 1, 11}), arcs);
  EXPECT_EQ(OK, ParseOidString("2", &arcs));
  EXPECT_EQ(std::vector<uint32_t>{2}, arcs);
  EXPECT_EQ(OK, ParseOidString("2.4294967295", &arcs));
  EXPECT_EQ((std::vector<uint32_t>{2, 4294967295u}), arcs);
}

TEST(OidTest, ParseOidStringFailures) {
  std::vector<uint32_t> arcs = {7};
  const char* const kMalformed[] = {
      "",       ".",      "1.",     ".1",      "1..2",
      "1.2.a",  " 1.2",   "1.2 ",   "+1.2",    "1.-2",
      "1,2",    "0x1.2",  "2.4294967296",
  };
  for (const char* text : kMalformed) {
    EXPECT_EQ(ERR_INVALID_OID_STRING, ParseOidString(text, &arcs)) << text;
  }
  EXPECT_EQ(ERR_INVALID_OID, ParseOidString("3.1", &arcs));
  EXPECT_EQ(ERR_INVALID_OID, ParseOidString("1.40", &arcs));
  // Untouched on failure.
  EXPECT_EQ(std::vector<uint32_t>{7}, arcs);
}

TEST(OidTest, FromStringAndToString) {
  absl::optional<ObjectIdentifier> oid =
      ObjectIdentifier::FromString("2.5.4.3");
  ASSERT_TRUE(oid);
  EXPECT_EQ("2.5.4.3", oid->ToString());
  EXPECT_EQ("1.2.840.113549", kRsadsi.ToString());
  EXPECT_FALSE(ObjectIdentifier::FromString("2.5..4"));
  EXPECT_FALSE(ObjectIdentifier::FromString("5.5"));

  std::ostringstream stream;
  stream << *oid << " " << kRsadsi;
  EXPECT_EQ("2.5.4.3 1.2.840.113549", stream.str());
}

TEST(OidTest, Ordering) {
  ObjectIdentifier a = *ObjectIdentifier::Create({1, 2});
  ObjectIdentifier b = *ObjectIdentifier::Create({1, 3});
  ObjectIdentifier c = *ObjectIdentifier::Create({1, 2, 1});
  ObjectIdentifier a2 = *ObjectIdentifier::Create({1, 2});

  EXPECT_EQ(a, a2);
  EXPECT_NE(a, b);
  EXPECT_LT(a, b);
  EXPECT_LT(a, c);
  EXPECT_LT(c, b);
  EXPECT_GT(b, c);

  std::set<ObjectIdentifier> set = {b, c, a, a2};
  ASSERT_EQ(3u, set.size());
  EXPECT_EQ(a, *set.begin());
  EXPECT_EQ(b, *set.rbegin());
}

TEST(OidTest, MixedComparisons) {
  ObjectIdentifier rsadsi = *ObjectIdentifier::Create({1, 2, 840, 113549});
  ObjectIdentifier shorter = *ObjectIdentifier::Create({1, 2, 840});

  EXPECT_TRUE(rsadsi == kRsadsi);
  EXPECT_TRUE(kRsadsi == rsadsi);
  EXPECT_FALSE(shorter == kRsadsi);
  EXPECT_TRUE(shorter < kRsadsi);
  EXPECT_TRUE(kRsadsi > shorter);
  EXPECT_EQ(rsadsi, ObjectIdentifier(kRsadsi));
}

TEST(OidTest, Append) {
  ObjectIdentifier oid = *ObjectIdentifier::Create({1});
  EXPECT_EQ(ERR_INVALID_OID, oid.Append(40));
  EXPECT_EQ("1", oid.ToString());
  EXPECT_EQ(OK, oid.Append(2));
  // Only the second arc is bounded.
  EXPECT_EQ(OK, oid.Append(840));
  EXPECT_EQ(OK, oid.Append(113549));
  EXPECT_EQ(kRsadsi, oid);

  ObjectIdentifier joint = *ObjectIdentifier::Create({2});
  EXPECT_EQ(OK, joint.Append(100));
  EXPECT_EQ("2.100", joint.ToString());
}

TEST(OidTest, StartsWith) {
  ObjectIdentifier oid = *ObjectIdentifier::Create({1, 2, 840, 113549, 1});
  EXPECT_TRUE(oid.StartsWith(kRsadsi));
  EXPECT_TRUE(oid.StartsWith(ConstOid(kShortArcs)));
  EXPECT_TRUE(oid.StartsWith(oid.arcs()));
  EXPECT_FALSE(oid.StartsWith(ConstOid(kLongArcs)));

  ObjectIdentifier rsadsi(kRsadsi);
  std::vector<uint32_t> longer = {1, 2, 840, 113549, 1, 1};
  EXPECT_FALSE(rsadsi.StartsWith(longer));
}

}  // namespace

}  // namespace asn1
