// Copyright 2024 The Chromium Authors
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BASE_DCHECK_IS_ON_H_
#define BASE_DCHECK_IS_ON_H_

// DCHECKs are compiled in for debug builds, and for release builds configured
// with -DASN1_DCHECK_ALWAYS_ON=ON (which defines DCHECK_ALWAYS_ON).
#if defined(NDEBUG) && !defined(DCHECK_ALWAYS_ON)
#define DCHECK_IS_ON() false
#else
#define DCHECK_IS_ON() true
#endif

#endif  // BASE_DCHECK_IS_ON_H_
