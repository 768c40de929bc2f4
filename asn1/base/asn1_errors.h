// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_BASE_ASN1_ERRORS_H_
#define ASN1_BASE_ASN1_ERRORS_H_

#include <string>

#include "asn1/base/asn1_export.h"

namespace asn1 {

// The asn1 module's error codes.
// Error values are negative.
enum Error {
  // No error.
  OK = 0,

#define ASN1_ERROR(label, value) ERR_##label = value,
#include "asn1/base/asn1_error_list.h"
#undef ASN1_ERROR
};

// Returns a textual representation of the error code for logging purposes.
ASN1_EXPORT std::string ErrorToString(int error);

// Same as above, but leaves off the leading "asn1::".
ASN1_EXPORT std::string ErrorToShortString(int error);

}  // namespace asn1

#endif  // ASN1_BASE_ASN1_ERRORS_H_
