// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/Random.h"

#include <sodium.h>

namespace nftsim
{

uint64_t
randomSeed()
{
    uint64_t seed = 0;
    // 0 is reserved for "pick a seed"
    while (seed == 0)
    {
        randombytes_buf(&seed, sizeof(seed));
    }
    return seed;
}
}
