#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>

namespace nftsim
{
// A fresh non-zero run seed drawn from the system CSPRNG.
uint64_t randomSeed();
}
