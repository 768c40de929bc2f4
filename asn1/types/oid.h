// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_OID_H_
#define ASN1_TYPES_OID_H_

#include <stddef.h>
#include <stdint.h>

#include <compare>
#include <iosfwd>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "absl/types/span.h"
#include "asn1/base/asn1_errors.h"
#include "asn1/base/asn1_export.h"

namespace asn1 {

// Checks the numbering rules of X.660 for an OBJECT IDENTIFIER:
//
//   * there is at least one arc,
//   * the first arc is 0 (itu-t), 1 (iso) or 2 (joint-iso-itu-t),
//   * under 0 and 1 the second arc, when present, is below 40.
//
// Returns OK or ERR_INVALID_OID.
constexpr Error ValidateOidArcs(absl::Span<const uint32_t> arcs) {
  if (arcs.empty())
    return ERR_INVALID_OID;
  if (arcs[0] > 2)
    return ERR_INVALID_OID;
  if (arcs[0] < 2 && arcs.size() > 1 && arcs[1] >= 40)
    return ERR_INVALID_OID;
  return OK;
}

// Parses dotted decimal text such as "1.2.840.113549" into |arcs|. Returns
// ERR_INVALID_OID_STRING if the text is not a '.' separated list of decimal
// numbers that each fit in 32 bits, otherwise the result of ValidateOidArcs.
// |arcs| is only written on success.
ASN1_EXPORT Error ParseOidString(absl::string_view text,
                                 std::vector<uint32_t>* arcs);

// A compile-time OBJECT IDENTIFIER: a view over a statically allocated arc
// array. The arcs are not copied and must outlive the ConstOid, which in
// practice means they have static storage duration.
//
//   inline constexpr uint32_t kSha256Arcs[] = {2, 16, 840, 1, 101, 3, 4, 2, 1};
//   inline constexpr ConstOid kOidSha256(kSha256Arcs);
//
// The arcs are expected to satisfy ValidateOidArcs(); a static_assert next to
// the definition is the usual way to check that.
//
// A ConstOid can parameterize a template, e.g. to bind a value type to the
// OID that identifies it:
//
//   template <ConstOid kAlgorithm>
//   struct AlgorithmIdentifier { ... };
//   AlgorithmIdentifier<kOidSha256> digest;
class ConstOid {
 public:
  template <size_t N>
  constexpr explicit ConstOid(const uint32_t (&arcs)[N])
      : arc_data(arcs), arc_count(N) {}

  constexpr size_t size() const { return arc_count; }
  constexpr uint32_t operator[](size_t i) const { return arc_data[i]; }
  constexpr absl::Span<const uint32_t> arcs() const {
    return absl::Span<const uint32_t>(arc_data, arc_count);
  }

  // Returns the dotted decimal form, e.g. "2.5.4.3".
  ASN1_EXPORT std::string ToString() const;

  friend constexpr bool operator==(const ConstOid& lhs, const ConstOid& rhs) {
    return (lhs <=> rhs) == 0;
  }

  friend constexpr std::strong_ordering operator<=>(const ConstOid& lhs,
                                                    const ConstOid& rhs) {
    for (size_t i = 0; i < lhs.arc_count && i < rhs.arc_count; ++i) {
      if (lhs.arc_data[i] != rhs.arc_data[i])
        return lhs.arc_data[i] <=> rhs.arc_data[i];
    }
    return lhs.arc_count <=> rhs.arc_count;
  }

  // Public so that ConstOid is a structural type and can be a non-type
  // template argument. Do not assign to them directly.
  const uint32_t* arc_data;
  size_t arc_count;
};

// An OBJECT IDENTIFIER value built at runtime. Instances created through
// Create(), FromString() and Append() always satisfy ValidateOidArcs().
class ASN1_EXPORT ObjectIdentifier {
 public:
  // Returns the identifier with the given arcs, or nullopt if they violate
  // the X.660 numbering rules.
  static absl::optional<ObjectIdentifier> Create(std::vector<uint32_t> arcs);

  // Returns the identifier written in dotted decimal as |text|, or nullopt.
  static absl::optional<ObjectIdentifier> FromString(absl::string_view text);

  explicit ObjectIdentifier(const ConstOid& oid);

  ObjectIdentifier(const ObjectIdentifier& other);
  ObjectIdentifier(ObjectIdentifier&& other) noexcept;
  ObjectIdentifier& operator=(const ObjectIdentifier& other);
  ObjectIdentifier& operator=(ObjectIdentifier&& other) noexcept;
  ~ObjectIdentifier();

  const std::vector<uint32_t>& arcs() const { return arcs_; }
  size_t size() const { return arcs_.size(); }

  // Adds |arc| to the end. Fails, leaving the identifier unchanged, when the
  // result would break the numbering rules (a second arc of 40 or more under
  // itu-t or iso).
  [[nodiscard]] Error Append(uint32_t arc);

  // Returns true if the first arcs of this identifier are |prefix|.
  bool StartsWith(absl::Span<const uint32_t> prefix) const;
  bool StartsWith(const ConstOid& prefix) const {
    return StartsWith(prefix.arcs());
  }

  // Returns the dotted decimal form, e.g. "1.2.840.113549".
  std::string ToString() const;

  friend bool operator==(const ObjectIdentifier&,
                         const ObjectIdentifier&) = default;
  friend auto operator<=>(const ObjectIdentifier&,
                          const ObjectIdentifier&) = default;

  friend ASN1_EXPORT bool operator==(const ObjectIdentifier& lhs,
                                     const ConstOid& rhs);
  friend ASN1_EXPORT std::strong_ordering operator<=>(
      const ObjectIdentifier& lhs,
      const ConstOid& rhs);

 private:
  explicit ObjectIdentifier(std::vector<uint32_t> arcs);

  std::vector<uint32_t> arcs_;
};

ASN1_EXPORT std::ostream& operator<<(std::ostream& os, const ConstOid& oid);
ASN1_EXPORT std::ostream& operator<<(std::ostream& os,
                                     const ObjectIdentifier& oid);

}  // namespace asn1

#endif  // ASN1_TYPES_OID_H_
