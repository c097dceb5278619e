#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/LedgerManager.h"
#include "main/Config.h"
#include "simulation/NFTOperation.h"
#include "simulation/OperationOutcome.h"
#include "simulation/SimAccount.h"
#include "util/Math.h"
#include "util/NonCopyable.h"

#include <json/json.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace medida
{
class MetricsRegistry;
class Meter;
}

namespace nftsim
{

struct OperationStats
{
    uint64_t noOp{0};
    uint64_t success{0};
    uint64_t failure{0};

    uint64_t
    total() const
    {
        return noOp + success + failure;
    }
};

/**
 * Drives a randomized NFT workload against a fresh ledger.
 *
 * Construction runs genesis. Each ledger then runs a random number of
 * operations, of kinds drawn by the configured weights, before the close time
 * advances by a random step and the next ledger starts. Every random choice
 * comes from one engine seeded with the config's SEED, so two simulations
 * with the same config evolve identically.
 *
 * Failed operations are counted and the run continues, unless
 * HALT_ON_FAILURE is set, in which case the first failure stops the run.
 */
class NFTSimulation : public NonMovableOrCopyable
{
    struct OperationMetrics
    {
        medida::Meter& mNoOp;
        medida::Meter& mSuccess;
        medida::Meter& mFailure;

        OperationMetrics(medida::MetricsRegistry& m, std::string const& kind);
        void record(OperationOutcome const& outcome);
    };

    Config const mConfig;
    nftsim_default_random_engine mEngine;
    LedgerManager mLedgerManager;
    SimAccounts mAccounts;

    std::vector<std::unique_ptr<NFTOperation>> mOperations;
    std::vector<uint32_t> mWeights;

    std::map<OperationType, OperationStats> mStats;
    std::map<OperationType, std::unique_ptr<OperationMetrics>> mMetrics;

    uint32_t mLedgersRun{0};
    std::optional<OperationOutcome> mHaltingFailure;

    NFTOperation const& getOperation(OperationType type) const;

  public:
    NFTSimulation(Config const& cfg, medida::MetricsRegistry& metrics);

    // Runs cfg.NUM_LEDGERS ledgers. Returns false if the run halted on a
    // failure.
    bool run();

    // Runs one ledger's worth of operations and closes it. Returns false if
    // the simulation is (or became) halted.
    bool runLedger();

    // Runs one operation of a kind picked by weight.
    OperationOutcome runOperation();

    OperationOutcome runOperation(OperationType type);

    bool
    isHalted() const
    {
        return mHaltingFailure.has_value();
    }

    std::optional<OperationOutcome> const&
    getHaltingFailure() const
    {
        return mHaltingFailure;
    }

    uint32_t
    getLedgersRun() const
    {
        return mLedgersRun;
    }

    OperationStats const& getStats(OperationType type) const;
    OperationStats getTotalStats() const;

    LedgerManager&
    getLedgerManager()
    {
        return mLedgerManager;
    }

    SimAccounts const&
    getAccounts() const
    {
        return mAccounts;
    }

    Config const&
    getConfig() const
    {
        return mConfig;
    }

    Json::Value getStatus() const;

    // Writes getStatus() to `filename`. Throws std::runtime_error if the file
    // cannot be written.
    void writeStatus(std::string const& filename) const;
};
}
