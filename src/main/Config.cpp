// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "util/Logging.h"
#include "util/types.h"

#include <fmt/format.h>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <type_traits>

namespace nftsim
{
const std::string Config::STDIN_SPECIAL_NAME = "stdin";

Config::Config()
{
    CHAIN_ID = "nftsim-chain";
    SEED = 0;

    NUM_ACCOUNTS = 10;
    NUM_LEDGERS = 100;
    MAX_OPERATIONS_PER_LEDGER = 20;
    MIN_CLOSE_TIME_STEP = 1;
    MAX_CLOSE_TIME_STEP = 10;
    GENESIS_CLOSE_TIME = 1600000000;

    COIN_DENOMS = {"stake"};
    MIN_INITIAL_BALANCE = 1;
    MAX_INITIAL_BALANCE = 1000000;
    ZERO_BALANCE_PERCENT = 10;
    VESTING_PERCENT = 20;
    GENESIS_NFT_DENOMS = {"doge", "cat"};

    HALT_ON_FAILURE = false;

    OP_WEIGHT_TRANSFER_NFT = 33;
    OP_WEIGHT_EDIT_NFT_METADATA = 5;
    OP_WEIGHT_MINT_NFT = 10;
    OP_WEIGHT_BURN_NFT = 5;

    LOG_LEVEL = "info";
}

namespace
{
using ConfigItem = std::pair<std::string, std::shared_ptr<cpptoml::base>>;

bool
readBool(ConfigItem const& item)
{
    if (!item.second->as<bool>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<bool>()->get();
}

std::string
readString(ConfigItem const& item)
{
    if (!item.second->as<std::string>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<std::string>()->get();
}

template <typename T>
std::vector<T>
readArray(ConfigItem const& item)
{
    auto result = std::vector<T>{};
    if (!item.second->is_array())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("'{}' must be an array"), item.first));
    }
    for (auto v : item.second->as_array()->get())
    {
        if (!v->as<T>())
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("invalid element of '{}'"), item.first));
        }
        result.push_back(v->as<T>()->get());
    }
    return result;
}

template <typename T>
std::enable_if_t<std::is_signed_v<T>, T>
castInt(int64_t v, std::string const& name, T min, T max)
{
    if (v < min || v > max)
    {
        throw std::invalid_argument(fmt::format(FMT_STRING("bad '{}'"), name));
    }
    return static_cast<T>(v);
}

template <typename T>
std::enable_if_t<std::is_unsigned_v<T>, T>
castInt(int64_t v, std::string const& name, T min, T max)
{
    if (v < 0)
    {
        throw std::invalid_argument(fmt::format(FMT_STRING("bad '{}'"), name));
    }
    else
    {
        if (static_cast<T>(v) < min || static_cast<T>(v) > max)
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("bad '{}'"), name));
        }
    }
    return static_cast<T>(v);
}

template <typename T>
T
readInt(ConfigItem const& item, T min = std::numeric_limits<T>::min(),
        T max = std::numeric_limits<T>::max())
{
    if (!item.second->as<int64_t>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return castInt<T>(item.second->as<int64_t>()->get(), item.first, min, max);
}

// Reads an array of denoms: non-empty, printable, no duplicates.
std::vector<std::string>
readDenomArray(ConfigItem const& item)
{
    auto denoms = readArray<std::string>(item);
    std::set<std::string> seen;
    for (auto const& d : denoms)
    {
        if (d.empty() || d.size() > 32 || !isStringValid(d) || !isNonBlank(d))
        {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("invalid denom '{}' in '{}'"), d, item.first));
        }
        if (!seen.insert(d).second)
        {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("duplicate denom '{}' in '{}'"), d, item.first));
        }
    }
    return denoms;
}
}

void
Config::load(std::string const& filename)
{
    LOG_DEBUG(DEFAULT_LOG, "Loading config from: {}", filename);
    try
    {
        if (filename == Config::STDIN_SPECIAL_NAME)
        {
            load(std::cin);
        }
        else
        {
            std::ifstream ifs(filename);
            if (!ifs)
            {
                throw std::runtime_error(fmt::format(
                    FMT_STRING("Error opening file '{}'"), filename));
            }
            ifs.exceptions(std::ios::badbit);
            load(ifs);
        }
    }
    catch (std::exception const& ex)
    {
        std::string err("Failed to parse '");
        err += filename;
        err += "' :";
        err += ex.what();
        throw std::invalid_argument(err);
    }
}

void
Config::load(std::istream& in)
{
    std::shared_ptr<cpptoml::table> t;
    cpptoml::parser p(in);
    t = p.parse();
    processConfig(t);
}

void
Config::processConfig(std::shared_ptr<cpptoml::table> t)
{
    if (!t)
    {
        throw std::runtime_error("Could not parse toml");
    }

    for (auto& item : *t)
    {
        LOG_DEBUG(DEFAULT_LOG, "Config item: {}", item.first);

        std::map<std::string, std::function<void()>> confProcessor = {
            {"CHAIN_ID",
             [&]() {
                 CHAIN_ID = readString(item);
                 if (CHAIN_ID.empty())
                 {
                     throw std::invalid_argument("CHAIN_ID must not be empty");
                 }
             }},
            {"SEED", [&]() { SEED = readInt<uint64_t>(item); }},
            {"NUM_ACCOUNTS",
             [&]() { NUM_ACCOUNTS = readInt<uint32_t>(item, 1, 100000); }},
            {"NUM_LEDGERS", [&]() { NUM_LEDGERS = readInt<uint32_t>(item); }},
            {"MAX_OPERATIONS_PER_LEDGER",
             [&]() {
                 MAX_OPERATIONS_PER_LEDGER =
                     readInt<uint32_t>(item, 0, 100000);
             }},
            {"MIN_CLOSE_TIME_STEP",
             [&]() { MIN_CLOSE_TIME_STEP = readInt<uint64_t>(item); }},
            {"MAX_CLOSE_TIME_STEP",
             [&]() { MAX_CLOSE_TIME_STEP = readInt<uint64_t>(item); }},
            {"GENESIS_CLOSE_TIME",
             [&]() { GENESIS_CLOSE_TIME = readInt<uint64_t>(item); }},
            {"COIN_DENOMS",
             [&]() {
                 COIN_DENOMS = readDenomArray(item);
                 if (COIN_DENOMS.empty() ||
                     COIN_DENOMS.size() > MAX_COINS_PER_ACCOUNT)
                 {
                     throw std::invalid_argument(
                         "bad number of entries in 'COIN_DENOMS'");
                 }
             }},
            {"MIN_INITIAL_BALANCE",
             [&]() { MIN_INITIAL_BALANCE = readInt<int64_t>(item, 1); }},
            {"MAX_INITIAL_BALANCE",
             [&]() { MAX_INITIAL_BALANCE = readInt<int64_t>(item, 1); }},
            {"ZERO_BALANCE_PERCENT",
             [&]() { ZERO_BALANCE_PERCENT = readInt<uint32_t>(item, 0, 100); }},
            {"VESTING_PERCENT",
             [&]() { VESTING_PERCENT = readInt<uint32_t>(item, 0, 100); }},
            {"GENESIS_NFT_DENOMS",
             [&]() { GENESIS_NFT_DENOMS = readDenomArray(item); }},
            {"HALT_ON_FAILURE", [&]() { HALT_ON_FAILURE = readBool(item); }},
            {"OP_WEIGHT_TRANSFER_NFT",
             [&]() { OP_WEIGHT_TRANSFER_NFT = readInt<uint32_t>(item); }},
            {"OP_WEIGHT_EDIT_NFT_METADATA",
             [&]() { OP_WEIGHT_EDIT_NFT_METADATA = readInt<uint32_t>(item); }},
            {"OP_WEIGHT_MINT_NFT",
             [&]() { OP_WEIGHT_MINT_NFT = readInt<uint32_t>(item); }},
            {"OP_WEIGHT_BURN_NFT",
             [&]() { OP_WEIGHT_BURN_NFT = readInt<uint32_t>(item); }},
            {"LOG_FILE_PATH", [&]() { LOG_FILE_PATH = readString(item); }},
            {"LOG_LEVEL", [&]() { LOG_LEVEL = readString(item); }},
            {"STATS_FILE_PATH", [&]() { STATS_FILE_PATH = readString(item); }}};

        auto it = confProcessor.find(item.first);
        if (it != confProcessor.end())
        {
            it->second();
        }
        else
        {
            std::string err("Unknown configuration entry: '");
            err += item.first;
            err += "'";
            throw std::invalid_argument(err);
        }
    }

    validate();
}

void
Config::validate() const
{
    if (MIN_CLOSE_TIME_STEP > MAX_CLOSE_TIME_STEP)
    {
        throw std::invalid_argument(
            "MIN_CLOSE_TIME_STEP must not exceed MAX_CLOSE_TIME_STEP");
    }
    if (MIN_INITIAL_BALANCE > MAX_INITIAL_BALANCE)
    {
        throw std::invalid_argument(
            "MIN_INITIAL_BALANCE must not exceed MAX_INITIAL_BALANCE");
    }
    if (OP_WEIGHT_TRANSFER_NFT == 0 && OP_WEIGHT_EDIT_NFT_METADATA == 0 &&
        OP_WEIGHT_MINT_NFT == 0 && OP_WEIGHT_BURN_NFT == 0 &&
        MAX_OPERATIONS_PER_LEDGER != 0)
    {
        throw std::invalid_argument("at least one OP_WEIGHT_* must be set");
    }
}

uint32_t
Config::getOperationWeight(OperationType type) const
{
    switch (type)
    {
    case MINT_NFT:
        return OP_WEIGHT_MINT_NFT;
    case BURN_NFT:
        return OP_WEIGHT_BURN_NFT;
    case TRANSFER_NFT:
        return OP_WEIGHT_TRANSFER_NFT;
    case EDIT_NFT_METADATA:
        return OP_WEIGHT_EDIT_NFT_METADATA;
    }
    throw std::invalid_argument("unknown operation type");
}
}
