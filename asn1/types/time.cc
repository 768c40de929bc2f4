// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/time.h"

#include <stdint.h>

#include <ostream>

#include "absl/strings/str_format.h"
#include "base/logging.h"

namespace asn1 {

namespace {

constexpr int64_t kMinutesPerDay = 24 * 60;

// Offsets of a day or more are read as UTC, as absl::FixedTimeZone() does
// for offsets beyond a day. The offset is widened first so that converting
// minutes to seconds cannot overflow.
absl::TimeZone OffsetTimeZone(int utc_offset_minutes) {
  int64_t minutes = utc_offset_minutes;
  if (minutes <= -kMinutesPerDay || minutes >= kMinutesPerDay)
    return absl::UTCTimeZone();
  return absl::FixedTimeZone(static_cast<int>(minutes * 60));
}

absl::CivilSecond ToCivil(int year,
                          int month,
                          int day,
                          int hours,
                          int minutes,
                          int seconds) {
  return absl::CivilSecond(year, month, day, hours, minutes, seconds);
}

void WriteFields(std::ostream& os,
                 int year,
                 int month,
                 int day,
                 int hours,
                 int minutes,
                 int seconds) {
  os << absl::StrFormat("%04d-%02d-%02dT%02d:%02d:%02d", year, month, day,
                        hours, minutes, seconds);
}

}  // namespace

bool UtcTime::InUTCTimeRange() const {
  return 1950 <= year && year < 2050;
}

absl::Time UtcTime::ToTime() const {
  return absl::FromCivil(ToCivil(year, month, day, hours, minutes, seconds),
                         absl::UTCTimeZone());
}

// static
UtcTime UtcTime::FromTime(absl::Time time) {
  absl::CivilSecond civil = absl::ToCivilSecond(time, absl::UTCTimeZone());
  UtcTime result;
  result.year = static_cast<int>(civil.year());
  result.month = civil.month();
  result.day = civil.day();
  result.hours = civil.hour();
  result.minutes = civil.minute();
  result.seconds = civil.second();
  return result;
}

bool GeneralizedTime::InUTCTimeRange() const {
  return 1950 <= year && year < 2050;
}

absl::Time GeneralizedTime::ToTime() const {
  return absl::FromCivil(ToCivil(year, month, day, hours, minutes, seconds),
                         OffsetTimeZone(utc_offset_minutes));
}

// static
GeneralizedTime GeneralizedTime::FromTime(absl::Time time,
                                          int utc_offset_minutes) {
  DCHECK_LT(utc_offset_minutes, kMinutesPerDay);
  DCHECK_GT(utc_offset_minutes, -kMinutesPerDay);
  absl::CivilSecond civil =
      absl::ToCivilSecond(time, OffsetTimeZone(utc_offset_minutes));
  GeneralizedTime result;
  result.year = static_cast<int>(civil.year());
  result.month = civil.month();
  result.day = civil.day();
  result.hours = civil.hour();
  result.minutes = civil.minute();
  result.seconds = civil.second();
  result.utc_offset_minutes = utc_offset_minutes;
  return result;
}

std::ostream& operator<<(std::ostream& os, const UtcTime& value) {
  WriteFields(os, value.year, value.month, value.day, value.hours,
              value.minutes, value.seconds);
  return os << "Z";
}

std::ostream& operator<<(std::ostream& os, const GeneralizedTime& value) {
  WriteFields(os, value.year, value.month, value.day, value.hours,
              value.minutes, value.seconds);
  if (value.utc_offset_minutes == 0)
    return os << "Z";
  int64_t offset = value.utc_offset_minutes;
  if (offset < 0)
    offset = -offset;
  return os << absl::StrFormat("%c%02d:%02d",
                               value.utc_offset_minutes < 0 ? '-' : '+',
                               offset / 60, offset % 60);
}

}  // namespace asn1
