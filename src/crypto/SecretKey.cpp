// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "crypto/ByteSlice.h"
#include "crypto/CryptoError.h"
#include "crypto/Hex.h"
#include "util/GlobalChecks.h"

#include <cstring>
#include <sodium.h>

namespace nftsim
{

SecretKey::SecretKey() : mKeyType(PUBLIC_KEY_TYPE_ED25519)
{
    static_assert(crypto_sign_PUBLICKEYBYTES == sizeof(uint256),
                  "Unexpected public key length");
    static_assert(crypto_sign_SEEDBYTES == sizeof(uint256),
                  "Unexpected seed length");
    static_assert(crypto_sign_SECRETKEYBYTES == sizeof(uint512),
                  "Unexpected secret key length");
    static_assert(crypto_sign_BYTES == sizeof(uint512),
                  "Unexpected signature length");
}

SecretKey::~SecretKey()
{
    std::memset(mSecretKey.data(), 0, mSecretKey.size());
}

PublicKey const&
SecretKey::getPublicKey() const
{
    return mPublicKey;
}

bool
SecretKey::isZero() const
{
    for (auto i : mSecretKey)
    {
        if (i != 0)
        {
            return false;
        }
    }
    return true;
}

Signature
SecretKey::sign(ByteSlice const& bin) const
{
    releaseAssert(mKeyType == PUBLIC_KEY_TYPE_ED25519);

    Signature out(crypto_sign_BYTES, 0);
    if (crypto_sign_detached(out.data(), NULL, bin.data(), bin.size(),
                             mSecretKey.data()) != 0)
    {
        throw CryptoError("error while signing");
    }
    return out;
}

SecretKey
SecretKey::random()
{
    SecretKey sk;
    releaseAssert(sk.mKeyType == PUBLIC_KEY_TYPE_ED25519);
    if (crypto_sign_keypair(sk.mPublicKey.ed25519().data(),
                            sk.mSecretKey.data()) != 0)
    {
        throw CryptoError("error generating random secret key");
    }
    return sk;
}

SecretKey
SecretKey::pseudoRandomForTesting(nftsim_default_random_engine& engine)
{
    std::vector<uint8_t> bytes;
    bytes.reserve(crypto_sign_SEEDBYTES);
    for (size_t i = 0; i < crypto_sign_SEEDBYTES; ++i)
    {
        bytes.push_back(static_cast<uint8_t>(engine()));
    }
    return fromSeed(bytes);
}

SecretKey
SecretKey::fromSeed(ByteSlice const& seed)
{
    SecretKey sk;
    releaseAssert(sk.mKeyType == PUBLIC_KEY_TYPE_ED25519);

    if (seed.size() != crypto_sign_SEEDBYTES)
    {
        throw CryptoError("seed does not match byte size");
    }
    if (crypto_sign_seed_keypair(sk.mPublicKey.ed25519().data(),
                                 sk.mSecretKey.data(), seed.data()) != 0)
    {
        throw CryptoError("error generating secret key from seed");
    }
    return sk;
}

bool
PubKeyUtils::verifySig(PublicKey const& key, Signature const& signature,
                       ByteSlice const& bin)
{
    releaseAssert(key.type() == PUBLIC_KEY_TYPE_ED25519);
    if (signature.size() != crypto_sign_BYTES)
    {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), bin.data(),
                                       bin.size(),
                                       key.ed25519().data()) == 0;
}

std::string
KeyUtils::toHexString(PublicKey const& key)
{
    return binToHex(key.ed25519());
}

std::string
KeyUtils::toShortString(PublicKey const& key)
{
    return toHexString(key).substr(0, 8);
}
}
