#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "util/Math.h"
#include "util/XDROperators.h"
#include "xdr/NFT-types.h"

#include <string>

namespace nftsim
{

class ByteSlice;

class SecretKey
{
    using uint512 = xdr::opaque_array<64>;
    PublicKeyType mKeyType;
    uint512 mSecretKey;
    PublicKey mPublicKey;

  public:
    SecretKey();
    SecretKey(SecretKey const&) = default;
    SecretKey& operator=(SecretKey const&) = default;
    ~SecretKey();

    // Get the public key portion of this secret key.
    PublicKey const& getPublicKey() const;

    // Return true iff this key is all-zero.
    bool isZero() const;

    // Produce a signature of `bin` using this secret key.
    Signature sign(ByteSlice const& bin) const;

    // Create a new, random secret key.
    static SecretKey random();

    // Create a pseudo-random secret key drawn from `engine`. This is not
    // cryptographic randomness; it exists so simulated accounts are
    // reproducible from the run seed.
    static SecretKey
    pseudoRandomForTesting(nftsim_default_random_engine& engine);

    // Decode a secret key from a binary seed value.
    static SecretKey fromSeed(ByteSlice const& seed);

    bool
    operator==(SecretKey const& rh) const
    {
        return (mKeyType == rh.mKeyType) && (mSecretKey == rh.mSecretKey);
    }
};

// public key utility functions
namespace PubKeyUtils
{
// Return true iff `signature` is valid for `bin` under `key`.
bool verifySig(PublicKey const& key, Signature const& signature,
               ByteSlice const& bin);
}

namespace KeyUtils
{
// Full hex encoding of the key, used as the account address.
std::string toHexString(PublicKey const& key);

// Short hex prefix, for logging.
std::string toShortString(PublicKey const& key);
}
}
