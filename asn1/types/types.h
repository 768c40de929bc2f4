// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

// Convenience header that pulls in the whole ASN.1 type layer.

#ifndef ASN1_TYPES_TYPES_H_
#define ASN1_TYPES_TYPES_H_

#include "asn1/types/asn_type.h"
#include "asn1/types/bit_string.h"
#include "asn1/types/character_string.h"
#include "asn1/types/choice.h"
#include "asn1/types/instance_of.h"
#include "asn1/types/integer.h"
#include "asn1/types/known_oids.h"
#include "asn1/types/null.h"
#include "asn1/types/octet_string.h"
#include "asn1/types/oid.h"
#include "asn1/types/open.h"
#include "asn1/types/prefix.h"
#include "asn1/types/tag.h"
#include "asn1/types/time.h"

#endif  // ASN1_TYPES_TYPES_H_
