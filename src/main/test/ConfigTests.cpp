// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "test/Catch2.h"
#include "test/test.h"

#include <sstream>

using namespace nftsim;

namespace
{
Config
loadFromString(std::string const& toml)
{
    Config cfg;
    std::istringstream in(toml);
    cfg.load(in);
    return cfg;
}
}

TEST_CASE("config defaults", "[config]")
{
    Config cfg;
    REQUIRE(cfg.CHAIN_ID == "nftsim-chain");
    REQUIRE(cfg.SEED == 0);
    REQUIRE(cfg.COIN_DENOMS == std::vector<std::string>{"stake"});
    REQUIRE(cfg.getOperationWeight(TRANSFER_NFT) == 33);
    REQUIRE(cfg.getOperationWeight(EDIT_NFT_METADATA) == 5);
    REQUIRE(cfg.getOperationWeight(MINT_NFT) == 10);
    REQUIRE(cfg.getOperationWeight(BURN_NFT) == 5);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("load config", "[config]")
{
    auto cfg = loadFromString(R"(
CHAIN_ID = "my-chain"
SEED = 42
NUM_ACCOUNTS = 3
NUM_LEDGERS = 7
COIN_DENOMS = ["stake", "atom"]
GENESIS_NFT_DENOMS = ["collectible"]
HALT_ON_FAILURE = true
OP_WEIGHT_BURN_NFT = 0
MIN_CLOSE_TIME_STEP = 5
MAX_CLOSE_TIME_STEP = 5
STATS_FILE_PATH = "stats.json"
)");

    REQUIRE(cfg.CHAIN_ID == "my-chain");
    REQUIRE(cfg.SEED == 42);
    REQUIRE(cfg.NUM_ACCOUNTS == 3);
    REQUIRE(cfg.NUM_LEDGERS == 7);
    REQUIRE(cfg.COIN_DENOMS == std::vector<std::string>{"stake", "atom"});
    REQUIRE(cfg.GENESIS_NFT_DENOMS ==
            std::vector<std::string>{"collectible"});
    REQUIRE(cfg.HALT_ON_FAILURE);
    REQUIRE(cfg.getOperationWeight(BURN_NFT) == 0);
    REQUIRE(cfg.MIN_CLOSE_TIME_STEP == 5);
    REQUIRE(cfg.STATS_FILE_PATH == "stats.json");
    // untouched settings keep their defaults
    REQUIRE(cfg.getOperationWeight(TRANSFER_NFT) == 33);
}

TEST_CASE("bad config", "[config]")
{
    SECTION("unknown entry")
    {
        REQUIRE_THROWS_WITH(loadFromString("NOT_A_SETTING = 1"),
                            "Unknown configuration entry: 'NOT_A_SETTING'");
    }
    SECTION("wrong type")
    {
        REQUIRE_THROWS_AS(loadFromString("NUM_ACCOUNTS = \"ten\""),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(loadFromString("HALT_ON_FAILURE = 1"),
                          std::invalid_argument);
    }
    SECTION("out of range")
    {
        REQUIRE_THROWS_AS(loadFromString("NUM_ACCOUNTS = 0"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(loadFromString("SEED = -1"), std::invalid_argument);
        REQUIRE_THROWS_AS(loadFromString("VESTING_PERCENT = 101"),
                          std::invalid_argument);
    }
    SECTION("denoms")
    {
        REQUIRE_THROWS_AS(loadFromString("COIN_DENOMS = []"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(loadFromString("COIN_DENOMS = [\"a\", \"a\"]"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(loadFromString("GENESIS_NFT_DENOMS = [\" \"]"),
                          std::invalid_argument);
    }
    SECTION("inconsistent settings")
    {
        REQUIRE_THROWS_AS(
            loadFromString("MIN_CLOSE_TIME_STEP = 10\nMAX_CLOSE_TIME_STEP = 1"),
            std::invalid_argument);
        REQUIRE_THROWS_AS(loadFromString("MIN_INITIAL_BALANCE = 10\n"
                                         "MAX_INITIAL_BALANCE = 5"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(loadFromString("OP_WEIGHT_TRANSFER_NFT = 0\n"
                                         "OP_WEIGHT_EDIT_NFT_METADATA = 0\n"
                                         "OP_WEIGHT_MINT_NFT = 0\n"
                                         "OP_WEIGHT_BURN_NFT = 0"),
                          std::invalid_argument);
    }
    SECTION("missing file")
    {
        Config cfg;
        REQUIRE_THROWS_AS(cfg.load("/nonexistent/nftsim.cfg"),
                          std::invalid_argument);
    }
}
