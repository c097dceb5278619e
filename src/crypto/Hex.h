#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"
#include "xdr/NFT-types.h"

namespace nftsim
{

// Hex-encode a ByteSlice.
std::string binToHex(ByteSlice const& bin);
}
