// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/base/asn1_errors.h"

#include "base/logging.h"

namespace asn1 {

std::string ErrorToString(int error) {
  return "asn1::" + ErrorToShortString(error);
}

std::string ErrorToShortString(int error) {
  if (error == OK)
    return "OK";

  const char* error_string;
  switch (error) {
#define ASN1_ERROR(label, value) \
  case ERR_##label:              \
    error_string = #label;       \
    break;
#include "asn1/base/asn1_error_list.h"
#undef ASN1_ERROR
    default:
      NOTREACHED();
      error_string = "<unknown>";
  }
  return std::string("ERR_") + error_string;
}

}  // namespace asn1
