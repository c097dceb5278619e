// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/NFTSampler.h"
#include "ledger/LedgerTxn.h"
#include "ledger/NFTOwners.h"

namespace nftsim
{
namespace NFTSampler
{

std::optional<NFTRef>
randomOwnedNFT(AbstractLedgerTxnParent const& ledger,
               nftsim_default_random_engine& engine)
{
    auto owners = getOwners(ledger);
    if (owners.empty())
    {
        return std::nullopt;
    }

    auto const& owner = rand_element(owners, engine);
    auto const& collection = rand_element(owner.idCollections, engine);
    auto const& id = rand_element(collection.ids, engine);

    return NFTRef{owner.address, collection.denom, id};
}
}
}
