#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"
#include "xdr/NFT-types.h"
#include <sodium/crypto_hash_sha256.h>
#include <xdrpp/marshal.h>

namespace nftsim
{

// Plain SHA256
uint256 sha256(ByteSlice const& bin);

// SHA256 in incremental mode, for large inputs.
class SHA256
{
    crypto_hash_sha256_state mState;
    bool mFinished{false};

  public:
    SHA256();
    void reset();
    void add(ByteSlice const& bin);
    uint256 finish();
};

// sha256 of the XDR encoding of `t`.
template <typename T>
uint256
xdrSha256(T const& t)
{
    return sha256(xdr::xdr_to_opaque(t));
}
}
