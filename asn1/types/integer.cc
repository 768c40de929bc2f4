// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/integer.h"

#include <openssl/mem.h>

#include <ostream>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "asn1/base/asn1_errors.h"
#include "base/logging.h"

namespace asn1 {

namespace {

bool IsDecimalString(absl::string_view text) {
  if (!text.empty() && text.front() == '-')
    text.remove_prefix(1);
  if (text.empty())
    return false;
  for (char c : text) {
    if (!absl::ascii_isdigit(static_cast<unsigned char>(c)))
      return false;
  }
  return true;
}

}  // namespace

Integer::Integer() : bn_(BN_new()) {
  CHECK(bn_);
}

Integer::Integer(int64_t value) : Integer() {
  // Negate in unsigned arithmetic so that INT64_MIN does not overflow.
  uint64_t magnitude = value < 0 ? ~static_cast<uint64_t>(value) + 1
                                 : static_cast<uint64_t>(value);
  uint8_t bytes[8];
  for (size_t i = 0; i < sizeof(bytes); ++i)
    bytes[sizeof(bytes) - 1 - i] = static_cast<uint8_t>(magnitude >> (8 * i));
  CHECK(BN_bin2bn(bytes, sizeof(bytes), bn_.get()));
  BN_set_negative(bn_.get(), value < 0);
}

Integer::Integer(bssl::UniquePtr<BIGNUM> bn) : bn_(std::move(bn)) {
  DCHECK(bn_);
}

Integer::Integer(const Integer& other) : bn_(BN_dup(other.bn_.get())) {
  CHECK(bn_);
}

Integer::Integer(Integer&& other) noexcept = default;

Integer& Integer::operator=(const Integer& other) {
  if (this != &other) {
    bssl::UniquePtr<BIGNUM> copy(BN_dup(other.bn_.get()));
    CHECK(copy);
    bn_ = std::move(copy);
  }
  return *this;
}

Integer& Integer::operator=(Integer&& other) noexcept = default;

Integer::~Integer() = default;

// static
absl::optional<Integer> Integer::FromString(absl::string_view decimal) {
  // BN_dec2bn stops at the first non-digit rather than failing, so the text is
  // validated up front.
  if (!IsDecimalString(decimal)) {
    DVLOG(1) << ErrorToString(ERR_INVALID_INTEGER_STRING) << ": \"" << decimal
             << "\"";
    return absl::nullopt;
  }

  std::string terminated(decimal);
  BIGNUM* raw = nullptr;
  if (!BN_dec2bn(&raw, terminated.c_str())) {
    BN_free(raw);
    return absl::nullopt;
  }
  return Integer(bssl::UniquePtr<BIGNUM>(raw));
}

// static
Integer Integer::FromBytes(absl::Span<const uint8_t> magnitude, bool negative) {
  bssl::UniquePtr<BIGNUM> bn(
      BN_bin2bn(magnitude.data(), magnitude.size(), nullptr));
  CHECK(bn);
  BN_set_negative(bn.get(), negative);
  return Integer(std::move(bn));
}

absl::optional<int64_t> Integer::ToInt64() const {
  if (BN_num_bits(bn_.get()) > 64)
    return absl::nullopt;

  std::vector<uint8_t> bytes(BN_num_bytes(bn_.get()));
  BN_bn2bin(bn_.get(), bytes.data());
  uint64_t magnitude = 0;
  for (uint8_t byte : bytes)
    magnitude = (magnitude << 8) | byte;

  constexpr uint64_t kMaxMagnitude = uint64_t{1} << 63;
  if (is_negative()) {
    if (magnitude > kMaxMagnitude)
      return absl::nullopt;
    // -magnitude, computed without overflowing at INT64_MIN.
    return -static_cast<int64_t>(magnitude - 1) - 1;
  }
  if (magnitude >= kMaxMagnitude)
    return absl::nullopt;
  return static_cast<int64_t>(magnitude);
}

std::string Integer::ToString() const {
  char* decimal = BN_bn2dec(bn_.get());
  CHECK(decimal);
  std::string result(decimal);
  OPENSSL_free(decimal);
  return result;
}

bool Integer::is_negative() const {
  return BN_is_negative(bn_.get());
}

bool Integer::is_zero() const {
  return BN_is_zero(bn_.get());
}

bool operator==(const Integer& lhs, const Integer& rhs) {
  return BN_cmp(lhs.bn_.get(), rhs.bn_.get()) == 0;
}

std::strong_ordering operator<=>(const Integer& lhs, const Integer& rhs) {
  int result = BN_cmp(lhs.bn_.get(), rhs.bn_.get());
  if (result < 0)
    return std::strong_ordering::less;
  if (result > 0)
    return std::strong_ordering::greater;
  return std::strong_ordering::equal;
}

std::ostream& operator<<(std::ostream& os, const Integer& value) {
  return os << value.ToString();
}

}  // namespace asn1
