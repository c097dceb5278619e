// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#pragma once

namespace nftsim
{
void dbgAbort();

[[noreturn]] void printAssertFailureAndAbort(const char* s1, const char* file,
                                             int line);

// This is like `assert()` but it is _not_ sensitive to the presence of
// NDEBUG.
#define releaseAssert(e) \
    (static_cast<bool>(e) \
         ? void(0) \
         : nftsim::printAssertFailureAndAbort(#e, __FILE__, __LINE__))
}
