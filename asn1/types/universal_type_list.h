// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

// This file intentionally does not have header guards, it's included
// inside a macro to generate AsnType specializations.

// Each entry binds a C++ value type to the UNIVERSAL tag of the ASN.1 type it
// represents. Fixed-width integers, enumerations and collections are bound by
// the constrained specializations in asn_type.h instead.

ASN1_UNIVERSAL_TYPE(bool, kBool)
ASN1_UNIVERSAL_TYPE(absl::int128, kInteger)
ASN1_UNIVERSAL_TYPE(absl::uint128, kInteger)
ASN1_UNIVERSAL_TYPE(Integer, kInteger)
ASN1_UNIVERSAL_TYPE(BitString, kBitString)
ASN1_UNIVERSAL_TYPE(OctetString, kOctetString)
ASN1_UNIVERSAL_TYPE(Null, kNull)
ASN1_UNIVERSAL_TYPE(ObjectIdentifier, kOid)
ASN1_UNIVERSAL_TYPE(ConstOid, kOid)
ASN1_UNIVERSAL_TYPE(std::string, kUtf8String)
ASN1_UNIVERSAL_TYPE(absl::string_view, kUtf8String)
ASN1_UNIVERSAL_TYPE(UtcTime, kUtcTime)
ASN1_UNIVERSAL_TYPE(GeneralizedTime, kGeneralizedTime)
