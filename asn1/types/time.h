// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_TIME_H_
#define ASN1_TYPES_TIME_H_

#include <compare>
#include <iosfwd>

#include "absl/time/time.h"
#include "asn1/base/asn1_export.h"

namespace asn1 {

// The value of a UTCTime: a calendar date and time of day in UTC, to the
// second. The fields are not range checked.
struct ASN1_EXPORT UtcTime {
  // Returns true if the value can be written with the two digit year of the
  // UTCTime notation, i.e. the year is in [1950, 2050).
  bool InUTCTimeRange() const;

  absl::Time ToTime() const;
  static UtcTime FromTime(absl::Time time);

  int year = 0;
  int month = 0;
  int day = 0;
  int hours = 0;
  int minutes = 0;
  int seconds = 0;

  friend bool operator==(const UtcTime&, const UtcTime&) = default;
  friend auto operator<=>(const UtcTime&, const UtcTime&) = default;
};

// The value of a GeneralizedTime: local calendar fields plus the fixed
// offset from UTC, in minutes, at which they were read. Two values denoting
// the same instant at different offsets are not equal; compare ToTime() for
// that.
struct ASN1_EXPORT GeneralizedTime {
  // Returns true if the value's year is in [1950, 2050).
  bool InUTCTimeRange() const;

  // An offset of a day or more is read as UTC.
  absl::Time ToTime() const;
  // |utc_offset_minutes| must be less than a day in magnitude.
  static GeneralizedTime FromTime(absl::Time time, int utc_offset_minutes = 0);

  int year = 0;
  int month = 0;
  int day = 0;
  int hours = 0;
  int minutes = 0;
  int seconds = 0;
  int utc_offset_minutes = 0;

  friend bool operator==(const GeneralizedTime&,
                         const GeneralizedTime&) = default;
};

// Writes "YYYY-MM-DDTHH:MM:SSZ", or a "+HH:MM" style suffix for a
// GeneralizedTime with a non-zero offset.
ASN1_EXPORT std::ostream& operator<<(std::ostream& os, const UtcTime& value);
ASN1_EXPORT std::ostream& operator<<(std::ostream& os,
                                     const GeneralizedTime& value);

}  // namespace asn1

#endif  // ASN1_TYPES_TIME_H_
