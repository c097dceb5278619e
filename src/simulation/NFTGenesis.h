#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/SimAccount.h"
#include "util/Math.h"

#include <string>
#include <vector>

namespace nftsim
{

class Config;
class LedgerManager;

namespace NFTGenesis
{
// Creates cfg.NUM_ACCOUNTS accounts with keys, balances and vesting drawn
// from `engine`, then gives each account, with probability 1/2 per denom in
// cfg.GENESIS_NFT_DENOMS, one NFT of that denom. The same engine state and
// config always produce the same ledger.
SimAccounts apply(LedgerManager& ledger, Config const& cfg,
                  nftsim_default_random_engine& engine);

SimAccounts createAccounts(LedgerManager& ledger, Config const& cfg,
                           nftsim_default_random_engine& engine);

// Returns the number of NFTs minted.
size_t mintInitialNFTs(LedgerManager& ledger, SimAccounts const& accounts,
                       std::vector<std::string> const& denoms,
                       nftsim_default_random_engine& engine);
}
}
