// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_OCTET_STRING_H_
#define ASN1_TYPES_OCTET_STRING_H_

#include <stddef.h>
#include <stdint.h>

#include <compare>
#include <iosfwd>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "asn1/base/asn1_export.h"

namespace asn1 {

// An owned buffer of bytes, the value type of the ASN.1 OCTET STRING type.
//
// This is a distinct type rather than std::vector<uint8_t> because a vector of
// bytes is a SEQUENCE OF INTEGER as far as tagging is concerned.
class ASN1_EXPORT OctetString {
 public:
  // Creates an empty OctetString.
  OctetString();

  explicit OctetString(std::vector<uint8_t> bytes);

  // Creates an OctetString from a constant array |data|.
  template <size_t N>
  explicit OctetString(const uint8_t (&data)[N]) : bytes_(data, data + N) {}

  // Copies the bytes of |data|.
  explicit OctetString(absl::string_view data);

  OctetString(const OctetString& other);
  OctetString(OctetString&& other) noexcept;
  OctetString& operator=(const OctetString& other);
  OctetString& operator=(OctetString&& other) noexcept;
  ~OctetString();

  size_t size() const { return bytes_.size(); }
  bool empty() const { return bytes_.empty(); }

  const std::vector<uint8_t>& bytes() const { return bytes_; }
  absl::Span<const uint8_t> AsSpan() const { return bytes_; }

  // Returns a copy of the bytes as a std::string.
  std::string AsString() const;

  friend bool operator==(const OctetString&, const OctetString&) = default;
  friend auto operator<=>(const OctetString&, const OctetString&) = default;

 private:
  std::vector<uint8_t> bytes_;
};

// Writes the contents as upper case hex, e.g. "00FF10".
ASN1_EXPORT std::ostream& operator<<(std::ostream& os,
                                     const OctetString& value);

}  // namespace asn1

#endif  // ASN1_TYPES_OCTET_STRING_H_
