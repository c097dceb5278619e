#pragma once
// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/NFT-transaction.h"

#include <cpptoml.h>

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace nftsim
{

class Config
{
    void processConfig(std::shared_ptr<cpptoml::table>);

  public:
    static const std::string STDIN_SPECIAL_NAME;

    Config();

    void load(std::string const& filename);
    void load(std::istream& in);

    // Checks relations between settings. Throws std::invalid_argument.
    void validate() const;

    uint32_t getOperationWeight(OperationType type) const;

    // Identity of the simulated chain; transactions are signed over
    // sha256(CHAIN_ID).
    std::string CHAIN_ID;

    // Seed of the run's random engine. 0 picks a fresh seed at startup (and
    // logs it so the run can be replayed).
    uint64_t SEED;

    uint32_t NUM_ACCOUNTS;
    uint32_t NUM_LEDGERS;

    // Each ledger runs a uniformly random number of operations in
    // [0, MAX_OPERATIONS_PER_LEDGER].
    uint32_t MAX_OPERATIONS_PER_LEDGER;

    // Seconds the close time advances between ledgers, uniform in
    // [MIN_CLOSE_TIME_STEP, MAX_CLOSE_TIME_STEP].
    uint64_t MIN_CLOSE_TIME_STEP;
    uint64_t MAX_CLOSE_TIME_STEP;
    uint64_t GENESIS_CLOSE_TIME;

    // genesis
    std::vector<std::string> COIN_DENOMS;
    int64_t MIN_INITIAL_BALANCE;
    int64_t MAX_INITIAL_BALANCE;
    uint32_t ZERO_BALANCE_PERCENT;
    uint32_t VESTING_PERCENT;
    std::vector<std::string> GENESIS_NFT_DENOMS;

    // Stop the run at the first failed operation.
    bool HALT_ON_FAILURE;

    uint32_t OP_WEIGHT_TRANSFER_NFT;
    uint32_t OP_WEIGHT_EDIT_NFT_METADATA;
    uint32_t OP_WEIGHT_MINT_NFT;
    uint32_t OP_WEIGHT_BURN_NFT;

    std::string LOG_FILE_PATH;
    std::string LOG_LEVEL;

    // Where to write the JSON run summary; empty means don't.
    std::string STATS_FILE_PATH;
};
}
