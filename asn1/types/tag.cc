// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "asn1/types/tag.h"

#include <ostream>

#include "absl/strings/str_cat.h"
#include "base/logging.h"

namespace asn1 {

const char* TagClassToString(TagClass tag_class) {
  switch (tag_class) {
    case TagClass::kUniversal:
      return "UNIVERSAL";
    case TagClass::kApplication:
      return "APPLICATION";
    case TagClass::kContextSpecific:
      return "CONTEXT-SPECIFIC";
    case TagClass::kPrivate:
      return "PRIVATE";
  }
  NOTREACHED();
  return "<unknown>";
}

const char* UniversalTagName(uint32_t number) {
  switch (number) {
#define ASN1_UNIVERSAL_TAG(label, value, name) \
  case value:                                  \
    return name;
#include "asn1/types/universal_tag_list.h"
#undef ASN1_UNIVERSAL_TAG
    default:
      return nullptr;
  }
}

std::string TagToString(const Tag& tag) {
  if (tag.tag_class == TagClass::kContextSpecific)
    return absl::StrCat("[", tag.number, "]");
  return absl::StrCat("[", TagClassToString(tag.tag_class), " ", tag.number,
                      "]");
}

std::ostream& operator<<(std::ostream& os, TagClass tag_class) {
  return os << TagClassToString(tag_class);
}

std::ostream& operator<<(std::ostream& os, const Tag& tag) {
  return os << TagToString(tag);
}

}  // namespace asn1
