#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/NFT-ledger-entries.h"

#include <string>
#include <vector>

namespace nftsim
{

class AbstractLedgerTxnParent;

// The ids a single owner holds within one denom.
struct IDCollection
{
    std::string denom;
    std::vector<std::string> ids;
};

struct Owner
{
    AccountID address;
    std::vector<IDCollection> idCollections;
};

// Lists every account that currently owns at least one NFT, together with
// what it owns. Owners are ordered by hex address, collections by denom and
// ids lexicographically, so the listing only depends on ledger contents.
std::vector<Owner> getOwners(AbstractLedgerTxnParent const& ledger);

// Total number of NFTs visible from `ledger`.
size_t countNFTs(AbstractLedgerTxnParent const& ledger);
}
