// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/oid.h"

#include <algorithm>
#include <ostream>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "base/logging.h"

namespace asn1 {

namespace {

bool IsAllDigits(absl::string_view text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(), [](char c) {
           return absl::ascii_isdigit(static_cast<unsigned char>(c));
         });
}

}  // namespace

Error ParseOidString(absl::string_view text, std::vector<uint32_t>* arcs) {
  std::vector<uint32_t> parsed;
  for (absl::string_view component : absl::StrSplit(text, '.')) {
    // SimpleAtoi tolerates whitespace and signs, which dotted notation does
    // not.
    uint32_t arc;
    if (!IsAllDigits(component) || !absl::SimpleAtoi(component, &arc))
      return ERR_INVALID_OID_STRING;
    parsed.push_back(arc);
  }

  Error error = ValidateOidArcs(parsed);
  if (error != OK)
    return error;
  *arcs = std::move(parsed);
  return OK;
}

std::string ConstOid::ToString() const {
  return absl::StrJoin(arcs(), ".");
}

// static
absl::optional<ObjectIdentifier> ObjectIdentifier::Create(
    std::vector<uint32_t> arcs) {
  Error error = ValidateOidArcs(arcs);
  if (error != OK) {
    DVLOG(1) << ErrorToString(error) << ": " << absl::StrJoin(arcs, ".");
    return absl::nullopt;
  }
  return ObjectIdentifier(std::move(arcs));
}

// static
absl::optional<ObjectIdentifier> ObjectIdentifier::FromString(
    absl::string_view text) {
  std::vector<uint32_t> arcs;
  Error error = ParseOidString(text, &arcs);
  if (error != OK) {
    DVLOG(1) << ErrorToString(error) << ": \"" << text << "\"";
    return absl::nullopt;
  }
  return ObjectIdentifier(std::move(arcs));
}

ObjectIdentifier::ObjectIdentifier(const ConstOid& oid)
    : arcs_(oid.arcs().begin(), oid.arcs().end()) {
  DCHECK_EQ(OK, ValidateOidArcs(arcs_));
}

ObjectIdentifier::ObjectIdentifier(std::vector<uint32_t> arcs)
    : arcs_(std::move(arcs)) {}

ObjectIdentifier::ObjectIdentifier(const ObjectIdentifier& other) = default;
ObjectIdentifier::ObjectIdentifier(ObjectIdentifier&& other) noexcept =
    default;
ObjectIdentifier& ObjectIdentifier::operator=(const ObjectIdentifier& other) =
    default;
ObjectIdentifier& ObjectIdentifier::operator=(
    ObjectIdentifier&& other) noexcept = default;
ObjectIdentifier::~ObjectIdentifier() = default;

Error ObjectIdentifier::Append(uint32_t arc) {
  // Only the second arc is constrained once the first is valid.
  if (arcs_.size() == 1 && arcs_[0] < 2 && arc >= 40) {
    DVLOG(1) << ErrorToString(ERR_INVALID_OID) << ": " << ToString() << "."
             << arc;
    return ERR_INVALID_OID;
  }
  arcs_.push_back(arc);
  return OK;
}

bool ObjectIdentifier::StartsWith(absl::Span<const uint32_t> prefix) const {
  return prefix.size() <= arcs_.size() &&
         std::equal(prefix.begin(), prefix.end(), arcs_.begin());
}

std::string ObjectIdentifier::ToString() const {
  return absl::StrJoin(arcs_, ".");
}

bool operator==(const ObjectIdentifier& lhs, const ConstOid& rhs) {
  return absl::Span<const uint32_t>(lhs.arcs_) == rhs.arcs();
}

std::strong_ordering operator<=>(const ObjectIdentifier& lhs,
                                 const ConstOid& rhs) {
  absl::Span<const uint32_t> rhs_arcs = rhs.arcs();
  return std::lexicographical_compare_three_way(
      lhs.arcs_.begin(), lhs.arcs_.end(), rhs_arcs.begin(), rhs_arcs.end());
}

std::ostream& operator<<(std::ostream& os, const ConstOid& oid) {
  return os << oid.ToString();
}

std::ostream& operator<<(std::ostream& os, const ObjectIdentifier& oid) {
  return os << oid.ToString();
}

}  // namespace asn1
