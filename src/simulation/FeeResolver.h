#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/SimAccount.h"
#include "util/Math.h"
#include "xdr/NFT-ledger-entries.h"

#include <vector>

namespace nftsim
{

class AbstractLedgerTxnParent;

// Everything needed to sign and pay for a transaction from one address.
struct ResolvedAccount
{
    SimAccount const& account;
    AccountEntry entry;
    std::vector<Coin> fee;
};

namespace FeeResolver
{
// Returns the simulated account holding the key for `address`. Throws
// AccountNotFoundError ("account <address> not found").
SimAccount const& findAccount(SimAccounts const& accounts,
                              AccountID const& address);

// Loads the ledger account of `address`. Throws AccountNotFoundError.
AccountEntry resolveAccount(AbstractLedgerTxnParent const& ledger,
                            AccountID const& address);

// Visits `spendable` in a random order and takes the first coin with a
// positive amount; the fee is a uniform amount in [1, amount] of that coin.
// Throws InsufficientFundsError when no such coin exists.
std::vector<Coin> randomFees(nftsim_default_random_engine& engine,
                             std::vector<Coin> const& spendable);

// findAccount, resolveAccount and randomFees over the balance spendable at
// the ledger's close time.
ResolvedAccount resolve(AbstractLedgerTxnParent const& ledger,
                        SimAccounts const& accounts, AccountID const& address,
                        nftsim_default_random_engine& engine);
}
}
