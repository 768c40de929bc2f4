// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_KNOWN_OIDS_H_
#define ASN1_TYPES_KNOWN_OIDS_H_

#include <stdint.h>

#include "absl/strings/string_view.h"
#include "asn1/base/asn1_export.h"
#include "asn1/types/oid.h"

namespace asn1 {

namespace internal {

inline constexpr uint32_t kItuTArcs[] = {0};
inline constexpr uint32_t kIsoArcs[] = {1};
inline constexpr uint32_t kJointIsoItuTArcs[] = {2};

inline constexpr uint32_t kRsaEncryptionArcs[] = {1, 2, 840, 113549, 1, 1, 1};
inline constexpr uint32_t kSha256WithRsaEncryptionArcs[] = {1, 2,   840, 113549,
                                                            1, 1, 11};
inline constexpr uint32_t kEcPublicKeyArcs[] = {1, 2, 840, 10045, 2, 1};
inline constexpr uint32_t kEmailAddressArcs[] = {1, 2, 840, 113549, 1, 9, 1};
inline constexpr uint32_t kSha256Arcs[] = {2, 16, 840, 1, 101, 3, 4, 2, 1};

inline constexpr uint32_t kCommonNameArcs[] = {2, 5, 4, 3};
inline constexpr uint32_t kCountryNameArcs[] = {2, 5, 4, 6};
inline constexpr uint32_t kOrganizationNameArcs[] = {2, 5, 4, 10};
inline constexpr uint32_t kSubjectAltNameArcs[] = {2, 5, 29, 17};
inline constexpr uint32_t kBasicConstraintsArcs[] = {2, 5, 29, 19};

}  // namespace internal

// The three root arcs.
inline constexpr ConstOid kOidItuT(internal::kItuTArcs);
inline constexpr ConstOid kOidIso(internal::kIsoArcs);
inline constexpr ConstOid kOidJointIsoItuT(internal::kJointIsoItuTArcs);

// rsaEncryption: 1.2.840.113549.1.1.1 (RFC 8017)
inline constexpr ConstOid kOidRsaEncryption(internal::kRsaEncryptionArcs);
// sha256WithRSAEncryption: 1.2.840.113549.1.1.11 (RFC 8017)
inline constexpr ConstOid kOidSha256WithRsaEncryption(
    internal::kSha256WithRsaEncryptionArcs);
// id-ecPublicKey: 1.2.840.10045.2.1 (RFC 5480)
inline constexpr ConstOid kOidEcPublicKey(internal::kEcPublicKeyArcs);
// id-emailAddress: 1.2.840.113549.1.9.1 (RFC 5280)
inline constexpr ConstOid kOidEmailAddress(internal::kEmailAddressArcs);
// id-sha256: 2.16.840.1.101.3.4.2.1 (RFC 5754)
inline constexpr ConstOid kOidSha256(internal::kSha256Arcs);

// id-at-commonName: 2.5.4.3 (RFC 5280)
inline constexpr ConstOid kOidCommonName(internal::kCommonNameArcs);
// id-at-countryName: 2.5.4.6 (RFC 5280)
inline constexpr ConstOid kOidCountryName(internal::kCountryNameArcs);
// id-at-organizationName: 2.5.4.10 (RFC 5280)
inline constexpr ConstOid kOidOrganizationName(
    internal::kOrganizationNameArcs);
// id-ce-subjectAltName: 2.5.29.17 (RFC 5280)
inline constexpr ConstOid kOidSubjectAltName(internal::kSubjectAltNameArcs);
// id-ce-basicConstraints: 2.5.29.19 (RFC 5280)
inline constexpr ConstOid kOidBasicConstraints(
    internal::kBasicConstraintsArcs);

// Returns the registered short name of |oid|, such as "commonName", or an
// empty string_view if it is not one of the constants above.
ASN1_EXPORT absl::string_view GetOidName(const ConstOid& oid);
ASN1_EXPORT absl::string_view GetOidName(const ObjectIdentifier& oid);

}  // namespace asn1

#endif  // ASN1_TYPES_KNOWN_OIDS_H_
