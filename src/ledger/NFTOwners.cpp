// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/NFTOwners.h"
#include "crypto/SecretKey.h"
#include "ledger/LedgerTxn.h"

#include <map>

namespace nftsim
{

std::vector<Owner>
getOwners(AbstractLedgerTxnParent const& ledger)
{
    // hex address -> (address, denom -> ids)
    std::map<std::string,
             std::pair<AccountID, std::map<std::string, std::vector<std::string>>>>
        byOwner;

    // NFT keys are ordered by (denom, id), so ids come out sorted within
    // each denom.
    for (auto const& kv : ledger.getAllEntries(NFT))
    {
        auto const& nft = kv.second.data.nft();
        auto& slot = byOwner[KeyUtils::toHexString(nft.owner)];
        slot.first = nft.owner;
        slot.second[nft.denom].emplace_back(nft.id);
    }

    std::vector<Owner> owners;
    owners.reserve(byOwner.size());
    for (auto& kv : byOwner)
    {
        Owner owner;
        owner.address = kv.second.first;
        for (auto& coll : kv.second.second)
        {
            owner.idCollections.emplace_back(
                IDCollection{coll.first, std::move(coll.second)});
        }
        owners.emplace_back(std::move(owner));
    }
    return owners;
}

size_t
countNFTs(AbstractLedgerTxnParent const& ledger)
{
    return ledger.getAllEntries(NFT).size();
}
}
