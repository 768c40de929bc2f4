// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_NULL_H_
#define ASN1_TYPES_NULL_H_

#include <compare>
#include <ostream>

namespace asn1 {

// The value of the ASN.1 NULL type. It carries no data, so all instances are
// equal.
struct Null {
  friend constexpr bool operator==(const Null&, const Null&) = default;
  friend constexpr auto operator<=>(const Null&, const Null&) = default;
};

inline std::ostream& operator<<(std::ostream& os, Null) {
  return os << "NULL";
}

}  // namespace asn1

#endif  // ASN1_TYPES_NULL_H_
