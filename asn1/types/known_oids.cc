// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/known_oids.h"

namespace asn1 {

namespace {

struct OidName {
  ConstOid oid;
  const char* name;
};

constexpr OidName kOidNames[] = {
    {kOidItuT, "itu-t"},
    {kOidIso, "iso"},
    {kOidJointIsoItuT, "joint-iso-itu-t"},
    {kOidRsaEncryption, "rsaEncryption"},
    {kOidSha256WithRsaEncryption, "sha256WithRSAEncryption"},
    {kOidEcPublicKey, "id-ecPublicKey"},
    {kOidEmailAddress, "emailAddress"},
    {kOidSha256, "id-sha256"},
    {kOidCommonName, "commonName"},
    {kOidCountryName, "countryName"},
    {kOidOrganizationName, "organizationName"},
    {kOidSubjectAltName, "subjectAltName"},
    {kOidBasicConstraints, "basicConstraints"},
};

constexpr bool AllKnownOidsValid() {
  for (const OidName& entry : kOidNames) {
    if (ValidateOidArcs(entry.oid.arcs()) != OK)
      return false;
  }
  return true;
}

static_assert(AllKnownOidsValid(), "A well-known OID breaks X.660 numbering");

}  // namespace

absl::string_view GetOidName(const ConstOid& oid) {
  for (const OidName& entry : kOidNames) {
    if (entry.oid == oid)
      return entry.name;
  }
  return absl::string_view();
}

absl::string_view GetOidName(const ObjectIdentifier& oid) {
  for (const OidName& entry : kOidNames) {
    if (oid == entry.oid)
      return entry.name;
  }
  return absl::string_view();
}

}  // namespace asn1
