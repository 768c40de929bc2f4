// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

// This file intentionally does not have header guards, it's included
// inside a macro to generate enum values and their names.

// This file contains the list of asn1 errors.

// Object identifier arcs violate the X.660 numbering rules: there are no
// arcs, the first arc is not 0, 1 or 2, or the first arc is 0 or 1 and the
// second arc is 40 or more.
ASN1_ERROR(INVALID_OID, -1)

// The dotted text form of an object identifier is malformed: an empty
// component, a non-digit character, or an arc that does not fit in 32 bits.
ASN1_ERROR(INVALID_OID_STRING, -2)

// The decimal text form of an INTEGER is malformed.
ASN1_ERROR(INVALID_INTEGER_STRING, -3)
