#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "util/XDROperators.h"
#include "xdr/NFT-ledger-entries.h"

#include <string>
#include <utility>

namespace nftsim
{

template <typename T>
bool
lexCompare(T&& lhs1, T&& rhs1)
{
    return lhs1 < rhs1;
}

template <typename T, typename... U>
bool
lexCompare(T&& lhs1, T&& rhs1, U&&... args)
{
    if (lhs1 < rhs1)
    {
        return true;
    }
    else if (rhs1 < lhs1)
    {
        return false;
    }
    return lexCompare(std::forward<U>(args)...);
}

/**
 * Orders LedgerKeys by identity: first by type, then accounts by the raw
 * public key bytes and NFTs by (denom, id). Iterating a map ordered by this
 * comparator visits NFTs of one denom contiguously, sorted by id.
 */
struct LedgerEntryIdCmp
{
    bool operator()(LedgerKey const& a, LedgerKey const& b) const;
};

LedgerKey accountKey(AccountID const& accountID);

LedgerKey nftKey(std::string const& denom, std::string const& id);

LedgerKey LedgerEntryKey(LedgerEntry const& e);

// "denom/id", for logs and diagnostics
std::string nftName(std::string const& denom, std::string const& id);
}
