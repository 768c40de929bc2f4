// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_INTEGER_H_
#define ASN1_TYPES_INTEGER_H_

#include <stdint.h>

#include <compare>
#include <iosfwd>
#include <memory>
#include <string>

#include <openssl/bn.h>
#include <openssl/mem.h>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "absl/types/span.h"
#include "asn1/base/asn1_export.h"

namespace asn1 {

// An arbitrary-precision signed integer, the value type of the ASN.1 INTEGER
// type when the fixed-width built-in integers are too narrow. Backed by an
// BoringSSL BIGNUM; copies are deep.
//
// A moved-from Integer may only be assigned to or destroyed.
class ASN1_EXPORT Integer {
 public:
  // Constructs zero.
  Integer();
  explicit Integer(int64_t value);

  Integer(const Integer& other);
  Integer(Integer&& other) noexcept;
  Integer& operator=(const Integer& other);
  Integer& operator=(Integer&& other) noexcept;
  ~Integer();

  // Parses an optionally '-' prefixed run of decimal digits. Returns nullopt
  // for anything else, including surrounding whitespace and a '+' sign.
  static absl::optional<Integer> FromString(absl::string_view decimal);

  // Creates an integer from a big-endian |magnitude| and a sign.
  static Integer FromBytes(absl::Span<const uint8_t> magnitude, bool negative);

  // Returns the value if it fits in an int64_t.
  absl::optional<int64_t> ToInt64() const;

  // Returns the decimal representation, e.g. "-12345".
  std::string ToString() const;

  bool is_negative() const;
  bool is_zero() const;

  const BIGNUM* bignum() const { return bn_.get(); }

  friend ASN1_EXPORT bool operator==(const Integer& lhs, const Integer& rhs);
  friend ASN1_EXPORT std::strong_ordering operator<=>(const Integer& lhs,
                                                      const Integer& rhs);

 private:
  explicit Integer(bssl::UniquePtr<BIGNUM> bn);

  bssl::UniquePtr<BIGNUM> bn_;
};

ASN1_EXPORT std::ostream& operator<<(std::ostream& os, const Integer& value);

}  // namespace asn1

#endif  // ASN1_TYPES_INTEGER_H_
