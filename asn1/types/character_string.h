// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_CHARACTER_STRING_H_
#define ASN1_TYPES_CHARACTER_STRING_H_

#include <string>

#include "asn1/types/prefix.h"
#include "asn1/types/tag.h"

namespace asn1 {

// UTF-8 text. std::string is bound to UTF8String directly.
using Utf8String = std::string;

// The restricted character string types share the Utf8String representation
// and differ only in their tag. The permitted alphabet of each is not
// checked here; that is the job of the encoder for the type.
using IA5String = Implicit<kIA5String, Utf8String>;
using PrintableString = Implicit<kPrintableString, Utf8String>;
using VisibleString = Implicit<kVisibleString, Utf8String>;
using BmpString = Implicit<kBmpString, Utf8String>;
using UniversalString = Implicit<kUniversalString, Utf8String>;
using NumericString = Implicit<kNumericString, Utf8String>;
using TeletexString = Implicit<kTeletexString, Utf8String>;
using GeneralString = Implicit<kGeneralString, Utf8String>;
using GraphicString = Implicit<kGraphicString, Utf8String>;

}  // namespace asn1

#endif  // ASN1_TYPES_CHARACTER_STRING_H_
