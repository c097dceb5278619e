// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/NFTGenesis.h"
#include "ledger/LedgerManager.h"
#include "main/Config.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"

#include <algorithm>
#include <fmt/format.h>
#include <optional>

namespace nftsim
{
namespace NFTGenesis
{

SimAccounts
apply(LedgerManager& ledger, Config const& cfg,
      nftsim_default_random_engine& engine)
{
    auto accounts = createAccounts(ledger, cfg, engine);
    auto minted =
        mintInitialNFTs(ledger, accounts, cfg.GENESIS_NFT_DENOMS, engine);
    CLOG_INFO(Simulation, "Genesis: {} accounts, {} nfts", accounts.size(),
              minted);
    return accounts;
}

SimAccounts
createAccounts(LedgerManager& ledger, Config const& cfg,
               nftsim_default_random_engine& engine)
{
    // vesting ends somewhere within the simulated time span
    uint64_t const maxVestingSpan =
        std::max<uint64_t>(1, uint64_t(cfg.NUM_LEDGERS) *
                                  std::max<uint64_t>(1, cfg.MAX_CLOSE_TIME_STEP));

    SimAccounts accounts;
    accounts.reserve(cfg.NUM_ACCOUNTS);
    for (uint32_t i = 0; i < cfg.NUM_ACCOUNTS; ++i)
    {
        auto key = SecretKey::pseudoRandomForTesting(engine);
        bool zeroBalance =
            rand_uniform<uint32_t>(0, 99, engine) < cfg.ZERO_BALANCE_PERCENT;

        std::vector<Coin> balances;
        if (!zeroBalance)
        {
            for (auto const& denom : cfg.COIN_DENOMS)
            {
                Coin coin;
                coin.denom = denom;
                coin.amount = rand_uniform<int64_t>(
                    cfg.MIN_INITIAL_BALANCE, cfg.MAX_INITIAL_BALANCE, engine);
                balances.emplace_back(coin);
            }
        }

        std::optional<VestingSchedule> vesting;
        if (!zeroBalance &&
            rand_uniform<uint32_t>(0, 99, engine) < cfg.VESTING_PERCENT)
        {
            vesting.emplace();
            for (auto const& coin : balances)
            {
                Coin locked;
                locked.denom = coin.denom;
                locked.amount = rand_uniform<int64_t>(0, coin.amount, engine);
                if (locked.amount > 0)
                {
                    vesting->locked.emplace_back(locked);
                }
            }
            vesting->endTime = cfg.GENESIS_CLOSE_TIME +
                               rand_uniform<uint64_t>(1, maxVestingSpan, engine);
        }

        ledger.createAccount(key.getPublicKey(), balances,
                             vesting ? &*vesting : nullptr);
        accounts.emplace_back(key, fmt::format(FMT_STRING("acc{}"), i));
        CLOG_DEBUG(Simulation, "Created account {} ({}){}{}",
                   accounts.back().getName(),
                   KeyUtils::toShortString(key.getPublicKey()),
                   zeroBalance ? " with zero balance" : "",
                   vesting ? " with vesting" : "");
    }
    return accounts;
}

size_t
mintInitialNFTs(LedgerManager& ledger, SimAccounts const& accounts,
                std::vector<std::string> const& denoms,
                nftsim_default_random_engine& engine)
{
    size_t minted = 0;
    for (auto const& account : accounts)
    {
        for (auto const& denom : denoms)
        {
            if (!rand_flip(engine))
            {
                continue;
            }
            auto id = rand_alpha_string(10, engine);
            auto tokenURI = rand_alpha_string(45, engine);
            if (loadNFTWithoutRecord(ledger.getRoot(), denom, id))
            {
                continue;
            }
            ledger.createNFT(denom, id, account.getAddress(), tokenURI);
            ++minted;
        }
    }
    return minted;
}
}
}
