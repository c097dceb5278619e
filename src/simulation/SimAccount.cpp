// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/SimAccount.h"

namespace nftsim
{

SimAccount::SimAccount(SecretKey const& secretKey, std::string name)
    : mSecretKey(secretKey), mName(std::move(name))
{
    if (mName.empty())
    {
        mName = KeyUtils::toShortString(mSecretKey.getPublicKey());
    }
}

std::string
SimAccount::getHexAddress() const
{
    return KeyUtils::toHexString(getAddress());
}

SimAccount const&
randomAccount(SimAccounts const& accounts,
              nftsim_default_random_engine& engine)
{
    return rand_element(accounts, engine);
}
}
