// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/time.h"

#include <limits>
#include <sstream>

#include <gtest/gtest.h>

namespace asn1 {

namespace {

TEST(TimeTest, InUTCTimeRange) {
  UtcTime time;
  time.year = 1950;
  EXPECT_TRUE(time.InUTCTimeRange());
  time.year = 2049;
  EXPECT_TRUE(time.InUTCTimeRange());
  time.year = 2050;
  EXPECT_FALSE(time.InUTCTimeRange());
  time.year = 1949;
  EXPECT_FALSE(time.InUTCTimeRange());

  GeneralizedTime generalized;
  generalized.year = 2050;
  EXPECT_FALSE(generalized.InUTCTimeRange());
  generalized.year = 2000;
  EXPECT_TRUE(generalized.InUTCTimeRange());
}

TEST(TimeTest, UtcTimeOrdering) {
  UtcTime earlier{2016, 12, 31, 23, 59, 59};
  UtcTime later{2017, 1, 1, 0, 0, 0};
  EXPECT_LT(earlier, later);
  EXPECT_NE(earlier, later);
  EXPECT_EQ(later, (UtcTime{2017, 1, 1, 0, 0, 0}));
}

TEST(TimeTest, UtcTimeToTime) {
  UtcTime epoch{1970, 1, 1, 0, 0, 0};
  EXPECT_EQ(absl::UnixEpoch(), epoch.ToTime());

  UtcTime time{2001, 9, 9, 1, 46, 40};
  EXPECT_EQ(absl::FromUnixSeconds(1000000000), time.ToTime());
  EXPECT_EQ(time, UtcTime::FromTime(time.ToTime()));
}

TEST(TimeTest, GeneralizedTimeOffset) {
  // 2001-09-09T03:46:40+02:00 is the same instant as 01:46:40Z.
  GeneralizedTime local{2001, 9, 9, 3, 46, 40, 120};
  EXPECT_EQ(absl::FromUnixSeconds(1000000000), local.ToTime());

  GeneralizedTime utc =
      GeneralizedTime::FromTime(absl::FromUnixSeconds(1000000000));
  EXPECT_EQ(1, utc.hours);
  EXPECT_EQ(0, utc.utc_offset_minutes);
  // Equal instants, different fields.
  EXPECT_NE(local, utc);
  EXPECT_EQ(local.ToTime(), utc.ToTime());

  EXPECT_EQ(local, GeneralizedTime::FromTime(local.ToTime(), 120));
}

TEST(TimeTest, ExtremeOffsets) {
  GeneralizedTime lowest{2024, 2, 29, 8, 5, 0,
                         std::numeric_limits<int>::min()};
  GeneralizedTime highest{2024, 2, 29, 8, 5, 0,
                          std::numeric_limits<int>::max()};
  std::ostringstream stream;
  stream << lowest << " " << highest;
  EXPECT_EQ(
      "2024-02-29T08:05:00-35791394:08 2024-02-29T08:05:00+35791394:07",
      stream.str());

  // Offsets of a day or more have no fixed zone and are read as UTC.
  GeneralizedTime utc{2024, 2, 29, 8, 5, 0, 0};
  EXPECT_EQ(utc.ToTime(), lowest.ToTime());
  EXPECT_EQ(utc.ToTime(), highest.ToTime());
  GeneralizedTime one_day = utc;
  one_day.utc_offset_minutes = 24 * 60;
  EXPECT_EQ(utc.ToTime(), one_day.ToTime());
}

TEST(TimeTest, Stream) {
  std::ostringstream stream;
  stream << UtcTime{2024, 2, 29, 8, 5, 0} << " "
         << GeneralizedTime{2024, 2, 29, 8, 5, 0, -330} << " "
         << GeneralizedTime{2024, 2, 29, 8, 5, 0, 0};
  EXPECT_EQ(
      "2024-02-29T08:05:00Z 2024-02-29T08:05:00-05:30 2024-02-29T08:05:00Z",
      stream.str());
}

}  // namespace

}  // namespace asn1
