// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_TYPES_INSTANCE_OF_H_
#define ASN1_TYPES_INSTANCE_OF_H_

#include "asn1/types/oid.h"
#include "asn1/types/tag.h"

namespace asn1 {

// The value of INSTANCE OF (X.681 annex C): a value together with the object
// identifier naming its type. It is encoded with the EXTERNAL tag.
template <typename T>
struct InstanceOf {
  static constexpr Tag kAsnTag = kExternal;

  ObjectIdentifier type_id;
  T value;

  friend bool operator==(const InstanceOf&, const InstanceOf&) = default;
};

}  // namespace asn1

#endif  // ASN1_TYPES_INSTANCE_OF_H_
