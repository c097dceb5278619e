// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/TransactionUtils.h"
#include "ledger/LedgerTxn.h"
#include "ledger/LedgerTypeUtils.h"
#include "util/types.h"

#include <algorithm>
#include <fmt/format.h>
#include <limits>
#include <stdexcept>

namespace nftsim
{

std::optional<LedgerEntry>
loadAccount(AbstractLedgerTxn& ltx, AccountID const& accountID)
{
    return ltx.load(accountKey(accountID));
}

std::shared_ptr<LedgerEntry const>
loadAccountWithoutRecord(AbstractLedgerTxnParent const& ledger,
                         AccountID const& accountID)
{
    return ledger.getNewestVersion(accountKey(accountID));
}

std::optional<LedgerEntry>
loadNFT(AbstractLedgerTxn& ltx, std::string const& denom,
        std::string const& id)
{
    return ltx.load(nftKey(denom, id));
}

std::shared_ptr<LedgerEntry const>
loadNFTWithoutRecord(AbstractLedgerTxnParent const& ledger,
                     std::string const& denom, std::string const& id)
{
    return ledger.getNewestVersion(nftKey(denom, id));
}

LedgerEntry
createAccount(AbstractLedgerTxn& ltx, AccountID const& accountID,
              std::vector<Coin> const& balances, VestingSchedule const* vesting)
{
    LedgerEntry le;
    le.data.type(ACCOUNT);
    auto& acc = le.data.account();
    acc.accountID = accountID;
    acc.seqNum = 0;
    for (auto const& coin : balances)
    {
        if (coin.amount == 0)
        {
            continue;
        }
        if (!isCoinValid(coin) ||
            !addBalance(acc.balances, coin.denom, coin.amount))
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("invalid initial balance {} {}"),
                            coin.amount, std::string(coin.denom)));
        }
    }
    if (vesting)
    {
        acc.vesting.activate() = *vesting;
    }

    auto& header = ltx.loadHeader();
    acc.accountNumber = header.nextAccountNumber;

    ltx.create(le);
    ++header.nextAccountNumber;
    return le;
}

LedgerEntry
createNFT(AbstractLedgerTxn& ltx, std::string const& denom,
          std::string const& id, AccountID const& owner,
          std::string const& tokenURI)
{
    LedgerEntry le;
    le.data.type(NFT);
    auto& nft = le.data.nft();
    nft.denom = denom;
    nft.id = id;
    nft.owner = owner;
    nft.tokenURI = tokenURI;
    ltx.create(le);
    return le;
}

int64_t
getBalance(std::vector<Coin> const& coins, std::string const& denom)
{
    auto it = std::find_if(coins.begin(), coins.end(), [&](Coin const& c) {
        return c.denom == denom;
    });
    return it == coins.end() ? 0 : it->amount;
}

std::vector<Coin>
getSpendableBalances(AccountEntry const& account, TimePoint now)
{
    std::vector<Coin> res(account.balances.begin(), account.balances.end());
    if (account.vesting && now < account.vesting->endTime)
    {
        for (auto& coin : res)
        {
            auto locked = getBalance(account.vesting->locked, coin.denom);
            coin.amount = std::max<int64_t>(0, coin.amount - locked);
        }
    }
    return res;
}

int64_t
getSpendableBalance(AccountEntry const& account, std::string const& denom,
                    TimePoint now)
{
    return getBalance(getSpendableBalances(account, now), denom);
}

bool
addBalance(std::vector<Coin>& coins, std::string const& denom, int64_t delta)
{
    auto it = std::lower_bound(
        coins.begin(), coins.end(), denom,
        [](Coin const& c, std::string const& d) { return c.denom < d; });
    bool found = it != coins.end() && it->denom == denom;
    int64_t current = found ? it->amount : 0;

    if (delta > 0 && current > std::numeric_limits<int64_t>::max() - delta)
    {
        return false;
    }
    int64_t next = current + delta;
    if (next < 0)
    {
        return false;
    }

    if (found)
    {
        if (next == 0)
        {
            coins.erase(it);
        }
        else
        {
            it->amount = next;
        }
    }
    else if (next != 0)
    {
        if (coins.size() >= MAX_COINS_PER_ACCOUNT)
        {
            return false;
        }
        Coin coin;
        coin.denom = denom;
        coin.amount = next;
        coins.insert(it, coin);
    }
    return true;
}

bool
isCoinValid(Coin const& coin)
{
    return coin.amount > 0 && !coin.denom.empty() &&
           isStringValid(coin.denom) && isNonBlank(coin.denom);
}

bool
isNFTStringValid(std::string const& str)
{
    return !str.empty() && isStringValid(str) && isNonBlank(str);
}

std::string
coinsToString(std::vector<Coin> const& coins)
{
    std::string res;
    for (auto const& coin : coins)
    {
        if (!res.empty())
        {
            res += ",";
        }
        res += fmt::format(FMT_STRING("{}{}"), coin.amount,
                           std::string(coin.denom));
    }
    return res;
}
}
