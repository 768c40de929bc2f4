// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_BIT_STRING_H_
#define ASN1_TYPES_BIT_STRING_H_

#include <stddef.h>
#include <stdint.h>

#include <iosfwd>
#include <vector>

#include "asn1/base/asn1_export.h"

namespace asn1 {

// Represents a BIT STRING value: a sequence of bits stored in |bytes| with
// the most significant bit of the first byte first. The final
// |unused_bits| bits of the last byte are not part of the value and must be
// zero.
class ASN1_EXPORT BitString {
 public:
  // Creates an empty BitString.
  BitString();

  // |unused_bits| must be less than 8, may only be non-zero when |bytes| is
  // non-empty, and the unused bits of the last byte must be zero.
  BitString(std::vector<uint8_t> bytes, uint8_t unused_bits);

  // Creates a BitString holding |bits| in order.
  static BitString FromBools(const std::vector<bool>& bits);

  BitString(const BitString& other);
  BitString(BitString&& other) noexcept;
  BitString& operator=(const BitString& other);
  BitString& operator=(BitString&& other) noexcept;
  ~BitString();

  const std::vector<uint8_t>& bytes() const { return bytes_; }
  uint8_t unused_bits() const { return unused_bits_; }

  // Returns the number of bits in the value.
  size_t bit_length() const { return bytes_.size() * 8 - unused_bits_; }

  // Returns true if the bit string contains 1 at the specified position.
  // Otherwise returns false.
  //
  // A return value of false can mean either:
  //  * The bit value at |bit_index| is 0.
  //  * There is no bit at |bit_index| (index is beyond the end).
  bool AssertsBit(size_t bit_index) const;

  friend bool operator==(const BitString&, const BitString&) = default;

 private:
  std::vector<uint8_t> bytes_;
  uint8_t unused_bits_ = 0;
};

// Writes the bits as a string of '0' and '1' characters.
ASN1_EXPORT std::ostream& operator<<(std::ostream& os, const BitString& value);

}  // namespace asn1

#endif  // ASN1_TYPES_BIT_STRING_H_
