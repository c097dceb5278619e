// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/FeeResolver.h"
#include "ledger/LedgerTxn.h"
#include "simulation/OperationOutcome.h"
#include "transactions/TransactionUtils.h"
#include "util/XDROperators.h"

#include <fmt/format.h>

namespace nftsim
{
namespace FeeResolver
{

SimAccount const&
findAccount(SimAccounts const& accounts, AccountID const& address)
{
    for (auto const& account : accounts)
    {
        if (account.getAddress() == address)
        {
            return account;
        }
    }
    throw AccountNotFoundError(
        fmt::format(FMT_STRING("account {} not found"),
                    KeyUtils::toHexString(address)));
}

AccountEntry
resolveAccount(AbstractLedgerTxnParent const& ledger, AccountID const& address)
{
    auto le = loadAccountWithoutRecord(ledger, address);
    if (!le)
    {
        throw AccountNotFoundError(
            fmt::format(FMT_STRING("account {} not found"),
                        KeyUtils::toHexString(address)));
    }
    return le->data.account();
}

std::vector<Coin>
randomFees(nftsim_default_random_engine& engine,
           std::vector<Coin> const& spendable)
{
    if (spendable.empty())
    {
        throw InsufficientFundsError("no coins found for random fees");
    }

    for (auto i : rand_permutation(spendable.size(), engine))
    {
        auto const& coin = spendable[i];
        if (coin.amount <= 0)
        {
            continue;
        }

        Coin fee;
        fee.denom = coin.denom;
        fee.amount = rand_uniform<int64_t>(1, coin.amount, engine);
        return {fee};
    }
    throw InsufficientFundsError("no coins found for random fees");
}

ResolvedAccount
resolve(AbstractLedgerTxnParent const& ledger, SimAccounts const& accounts,
        AccountID const& address, nftsim_default_random_engine& engine)
{
    auto const& account = findAccount(accounts, address);
    auto entry = resolveAccount(ledger, address);
    auto spendable =
        getSpendableBalances(entry, ledger.getHeader().closeTime);
    auto fee = randomFees(engine, spendable);
    return ResolvedAccount{account, entry, fee};
}
}
}
