// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/octet_string.h"

#include <ostream>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"

namespace asn1 {

OctetString::OctetString() = default;

OctetString::OctetString(std::vector<uint8_t> bytes)
    : bytes_(std::move(bytes)) {}

OctetString::OctetString(absl::string_view data)
    : bytes_(data.begin(), data.end()) {}

OctetString::OctetString(const OctetString& other) = default;
OctetString::OctetString(OctetString&& other) noexcept = default;
OctetString& OctetString::operator=(const OctetString& other) = default;
OctetString& OctetString::operator=(OctetString&& other) noexcept = default;
OctetString::~OctetString() = default;

std::string OctetString::AsString() const {
  return std::string(bytes_.begin(), bytes_.end());
}

std::ostream& operator<<(std::ostream& os, const OctetString& value) {
  return os << absl::AsciiStrToUpper(absl::BytesToHexString(value.AsString()));
}

}  // namespace asn1
