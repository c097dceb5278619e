// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/LedgerTypeUtils.h"
#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace nftsim
{

bool
LedgerEntryIdCmp::operator()(LedgerKey const& a, LedgerKey const& b) const
{
    if (a.type() != b.type())
    {
        return a.type() < b.type();
    }

    switch (a.type())
    {
    case ACCOUNT:
    {
        auto const& ak = a.account().accountID.ed25519();
        auto const& bk = b.account().accountID.ed25519();
        return std::lexicographical_compare(ak.begin(), ak.end(), bk.begin(),
                                            bk.end());
    }
    case NFT:
    {
        std::string const& aDenom = a.nft().denom;
        std::string const& bDenom = b.nft().denom;
        std::string const& aId = a.nft().id;
        std::string const& bId = b.nft().id;
        return lexCompare(aDenom, bDenom, aId, bId);
    }
    }
    throw std::runtime_error("unknown ledger key type");
}

LedgerKey
accountKey(AccountID const& accountID)
{
    LedgerKey key(ACCOUNT);
    key.account().accountID = accountID;
    return key;
}

LedgerKey
nftKey(std::string const& denom, std::string const& id)
{
    LedgerKey key(NFT);
    key.nft().denom = denom;
    key.nft().id = id;
    return key;
}

LedgerKey
LedgerEntryKey(LedgerEntry const& e)
{
    auto& d = e.data;
    switch (d.type())
    {
    case ACCOUNT:
        return accountKey(d.account().accountID);
    case NFT:
        return nftKey(d.nft().denom, d.nft().id);
    }
    throw std::runtime_error("unknown ledger entry type");
}

std::string
nftName(std::string const& denom, std::string const& id)
{
    return fmt::format(FMT_STRING("{}/{}"), denom, id);
}
}
