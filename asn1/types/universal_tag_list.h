// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

// This file intentionally does not have header guards, it's included
// inside a macro to generate the UNIVERSAL tag table.

// Each entry is (label, tag number, ASN.1 type name) as assigned by
// ITU-T X.680 section 8.6. Number 15 is reserved for future editions and is
// intentionally absent.

// Reserved for use by the encoding rules. Never the tag of a type.
ASN1_UNIVERSAL_TAG(EndOfContents, 0, "END-OF-CONTENTS")
ASN1_UNIVERSAL_TAG(Bool, 1, "BOOLEAN")
ASN1_UNIVERSAL_TAG(Integer, 2, "INTEGER")
ASN1_UNIVERSAL_TAG(BitString, 3, "BIT STRING")
ASN1_UNIVERSAL_TAG(OctetString, 4, "OCTET STRING")
ASN1_UNIVERSAL_TAG(Null, 5, "NULL")
ASN1_UNIVERSAL_TAG(Oid, 6, "OBJECT IDENTIFIER")
ASN1_UNIVERSAL_TAG(ObjectDescriptor, 7, "ObjectDescriptor")
ASN1_UNIVERSAL_TAG(External, 8, "EXTERNAL")
ASN1_UNIVERSAL_TAG(Real, 9, "REAL")
ASN1_UNIVERSAL_TAG(Enumerated, 10, "ENUMERATED")
ASN1_UNIVERSAL_TAG(EmbeddedPdv, 11, "EMBEDDED PDV")
ASN1_UNIVERSAL_TAG(Utf8String, 12, "UTF8String")
ASN1_UNIVERSAL_TAG(RelativeOid, 13, "RELATIVE-OID")
ASN1_UNIVERSAL_TAG(Time, 14, "TIME")
ASN1_UNIVERSAL_TAG(Sequence, 16, "SEQUENCE")
ASN1_UNIVERSAL_TAG(Set, 17, "SET")
ASN1_UNIVERSAL_TAG(NumericString, 18, "NumericString")
ASN1_UNIVERSAL_TAG(PrintableString, 19, "PrintableString")
ASN1_UNIVERSAL_TAG(TeletexString, 20, "TeletexString")
ASN1_UNIVERSAL_TAG(VideotexString, 21, "VideotexString")
ASN1_UNIVERSAL_TAG(IA5String, 22, "IA5String")
ASN1_UNIVERSAL_TAG(UtcTime, 23, "UTCTime")
ASN1_UNIVERSAL_TAG(GeneralizedTime, 24, "GeneralizedTime")
ASN1_UNIVERSAL_TAG(GraphicString, 25, "GraphicString")
ASN1_UNIVERSAL_TAG(VisibleString, 26, "VisibleString")
ASN1_UNIVERSAL_TAG(GeneralString, 27, "GeneralString")
ASN1_UNIVERSAL_TAG(UniversalString, 28, "UniversalString")
ASN1_UNIVERSAL_TAG(CharacterString, 29, "CHARACTER STRING")
ASN1_UNIVERSAL_TAG(BmpString, 30, "BMPString")
ASN1_UNIVERSAL_TAG(Date, 31, "DATE")
ASN1_UNIVERSAL_TAG(TimeOfDay, 32, "TIME-OF-DAY")
ASN1_UNIVERSAL_TAG(DateTime, 33, "DATE-TIME")
ASN1_UNIVERSAL_TAG(Duration, 34, "DURATION")
