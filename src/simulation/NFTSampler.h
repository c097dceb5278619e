#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "util/Math.h"
#include "xdr/NFT-ledger-entries.h"

#include <optional>
#include <string>

namespace nftsim
{

class AbstractLedgerTxnParent;

// An NFT and the account owning it at the time it was sampled.
struct NFTRef
{
    AccountID owner;
    std::string denom;
    std::string id;
};

namespace NFTSampler
{
// Picks an owner uniformly among the accounts holding NFTs, then one of its
// denoms uniformly, then one id within that denom uniformly. Empty when the
// ledger holds no NFT at all. Reads the ledger afresh on every call.
std::optional<NFTRef> randomOwnedNFT(AbstractLedgerTxnParent const& ledger,
                                     nftsim_default_random_engine& engine);
}
}
