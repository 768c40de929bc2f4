// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/bit_string.h"

#include <ostream>
#include <utility>

#include "base/logging.h"

namespace asn1 {

BitString::BitString() = default;

BitString::BitString(std::vector<uint8_t> bytes, uint8_t unused_bits)
    : bytes_(std::move(bytes)), unused_bits_(unused_bits) {
  DCHECK_LT(unused_bits, 8);
  DCHECK(unused_bits == 0 || !bytes_.empty());
  // The unused bits must be zero.
  DCHECK(bytes_.empty() || (bytes_.back() & ((1u << unused_bits) - 1)) == 0);
}

// static
BitString BitString::FromBools(const std::vector<bool>& bits) {
  std::vector<uint8_t> bytes((bits.size() + 7) / 8);
  for (size_t i = 0; i < bits.size(); ++i) {
    if (bits[i])
      bytes[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
  }
  uint8_t unused_bits = static_cast<uint8_t>(bytes.size() * 8 - bits.size());
  return BitString(std::move(bytes), unused_bits);
}

BitString::BitString(const BitString& other) = default;
BitString::BitString(BitString&& other) noexcept = default;
BitString& BitString::operator=(const BitString& other) = default;
BitString& BitString::operator=(BitString&& other) noexcept = default;
BitString::~BitString() = default;

bool BitString::AssertsBit(size_t bit_index) const {
  // Index of the byte that contains the bit.
  size_t byte_index = bit_index / 8;

  // If the bit is outside of the bitstring, by definition it is not
  // asserted.
  if (byte_index >= bytes_.size())
    return false;

  // Within a byte, bits are ordered from most significant to least significant.
  // Convert |bit_index| to an index within the |byte_index| byte, measured from
  // its least significant bit.
  uint8_t bit_index_in_byte = 7 - (bit_index - byte_index * 8);

  // The unused bits are zero, so they never assert.
  return 0 != (bytes_[byte_index] & (1 << bit_index_in_byte));
}

std::ostream& operator<<(std::ostream& os, const BitString& value) {
  for (size_t i = 0; i < value.bit_length(); ++i)
    os << (value.AssertsBit(i) ? '1' : '0');
  return os;
}

}  // namespace asn1
