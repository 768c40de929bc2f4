// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef ASN1_BASE_ASN1_EXPORT_H_
#define ASN1_BASE_ASN1_EXPORT_H_

// Defines ASN1_EXPORT so that functionality implemented by the asn1 module
// can be exported to consumers when it is built as a shared library.

#if defined(COMPONENT_BUILD)
#if defined(WIN32)

#if defined(ASN1_IMPLEMENTATION)
#define ASN1_EXPORT __declspec(dllexport)
#else
#define ASN1_EXPORT __declspec(dllimport)
#endif  // defined(ASN1_IMPLEMENTATION)

#else  // defined(WIN32)
#if defined(ASN1_IMPLEMENTATION)
#define ASN1_EXPORT __attribute__((visibility("default")))
#else
#define ASN1_EXPORT
#endif
#endif

#else  // defined(COMPONENT_BUILD)
#define ASN1_EXPORT
#endif

#endif  // ASN1_BASE_ASN1_EXPORT_H_
