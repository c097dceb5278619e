#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "util/Math.h"

#include <string>
#include <vector>

namespace nftsim
{

// A simulated participant: the signing key for one ledger account. Balances
// and the sequence number live in the ledger, never here.
class SimAccount
{
    SecretKey mSecretKey;
    std::string mName;

  public:
    SimAccount(SecretKey const& secretKey, std::string name = "");

    SecretKey const&
    getSecretKey() const
    {
        return mSecretKey;
    }

    AccountID const&
    getAddress() const
    {
        return mSecretKey.getPublicKey();
    }

    std::string getHexAddress() const;

    // Name for logs; the short hex address unless one was given.
    std::string const&
    getName() const
    {
        return mName;
    }
};

typedef std::vector<SimAccount> SimAccounts;

// Picks an account uniformly. Throws std::range_error on an empty set.
SimAccount const& randomAccount(SimAccounts const& accounts,
                                nftsim_default_random_engine& engine);
}
