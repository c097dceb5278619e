// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/NFTSimulation.h"
#include "ledger/NFTOwners.h"
#include "simulation/NFTGenesis.h"
#include "util/Logging.h"

#include <fmt/format.h>
#include <fstream>
#include <medida/meter.h>
#include <medida/metrics_registry.h>

namespace nftsim
{

namespace
{
std::string
metricKind(OperationType type)
{
    switch (type)
    {
    case MINT_NFT:
        return "mint-nft";
    case BURN_NFT:
        return "burn-nft";
    case TRANSFER_NFT:
        return "transfer-nft";
    case EDIT_NFT_METADATA:
        return "edit-nft-metadata";
    }
    return "unknown";
}

// in the order operations are weighted
std::vector<OperationType> const kOperationTypes = {
    TRANSFER_NFT, EDIT_NFT_METADATA, MINT_NFT, BURN_NFT};

Json::Value
statsToJson(OperationStats const& stats)
{
    Json::Value res;
    res["noop"] = static_cast<Json::UInt64>(stats.noOp);
    res["success"] = static_cast<Json::UInt64>(stats.success);
    res["failure"] = static_cast<Json::UInt64>(stats.failure);
    return res;
}
}

NFTSimulation::OperationMetrics::OperationMetrics(medida::MetricsRegistry& m,
                                                  std::string const& kind)
    : mNoOp(m.NewMeter({"simulation", kind, "noop"}, "op"))
    , mSuccess(m.NewMeter({"simulation", kind, "success"}, "op"))
    , mFailure(m.NewMeter({"simulation", kind, "failure"}, "op"))
{
}

void
NFTSimulation::OperationMetrics::record(OperationOutcome const& outcome)
{
    switch (outcome.kind)
    {
    case OperationOutcome::Kind::NO_OP:
        mNoOp.Mark();
        break;
    case OperationOutcome::Kind::SUCCESS:
        mSuccess.Mark();
        break;
    case OperationOutcome::Kind::FAILURE:
        mFailure.Mark();
        break;
    }
}

NFTSimulation::NFTSimulation(Config const& cfg,
                             medida::MetricsRegistry& metrics)
    : mConfig(cfg)
    , mEngine(cfg.SEED)
    , mLedgerManager(cfg.CHAIN_ID, cfg.GENESIS_CLOSE_TIME, metrics)
{
    mConfig.validate();

    for (auto type : kOperationTypes)
    {
        mOperations.emplace_back(makeNFTOperation(type));
        mWeights.emplace_back(mConfig.getOperationWeight(type));
        mStats[type] = OperationStats{};
        mMetrics[type] =
            std::make_unique<OperationMetrics>(metrics, metricKind(type));
    }

    CLOG_INFO(Simulation, "Starting simulation on chain '{}' with seed {}",
              mConfig.CHAIN_ID, mConfig.SEED);
    mAccounts = NFTGenesis::apply(mLedgerManager, mConfig, mEngine);
}

NFTOperation const&
NFTSimulation::getOperation(OperationType type) const
{
    for (auto const& op : mOperations)
    {
        if (op->getType() == type)
        {
            return *op;
        }
    }
    throw std::invalid_argument("unknown operation type");
}

bool
NFTSimulation::run()
{
    for (uint32_t i = 0; i < mConfig.NUM_LEDGERS; ++i)
    {
        if (!runLedger())
        {
            break;
        }
    }

    auto total = getTotalStats();
    CLOG_INFO(Simulation,
              "Simulation {} after {} ledgers: {} ops, {} success, {} "
              "failure, {} noop",
              isHalted() ? "halted" : "finished", mLedgersRun, total.total(),
              total.success, total.failure, total.noOp);
    return !isHalted();
}

bool
NFTSimulation::runLedger()
{
    if (isHalted())
    {
        return false;
    }

    auto numOps = rand_uniform<uint32_t>(0, mConfig.MAX_OPERATIONS_PER_LEDGER,
                                         mEngine);
    CLOG_DEBUG(Simulation, "Ledger {}: {} operations",
               mLedgerManager.getCurrentLedgerHeader().ledgerSeq, numOps);

    for (uint32_t i = 0; i < numOps; ++i)
    {
        auto outcome = runOperation();
        if (outcome.isFailure() && mConfig.HALT_ON_FAILURE)
        {
            CLOG_ERROR(Simulation, "Halting in ledger {}: {}",
                       mLedgerManager.getCurrentLedgerHeader().ledgerSeq,
                       outcome.toString());
            mHaltingFailure = outcome;
            return false;
        }
    }

    auto step = rand_uniform<uint64_t>(mConfig.MIN_CLOSE_TIME_STEP,
                                       mConfig.MAX_CLOSE_TIME_STEP, mEngine);
    mLedgerManager.closeLedger(
        mLedgerManager.getCurrentLedgerHeader().closeTime + step);
    ++mLedgersRun;
    return true;
}

OperationOutcome
NFTSimulation::runOperation()
{
    auto index = rand_weighted_index(mWeights, mEngine);
    return runOperation(mOperations.at(index)->getType());
}

OperationOutcome
NFTSimulation::runOperation(OperationType type)
{
    auto outcome = getOperation(type).invoke(mEngine, mLedgerManager,
                                             mAccounts, mConfig.CHAIN_ID);

    auto& stats = mStats[type];
    switch (outcome.kind)
    {
    case OperationOutcome::Kind::NO_OP:
        ++stats.noOp;
        CLOG_DEBUG(Simulation, "{}", outcome.toString());
        break;
    case OperationOutcome::Kind::SUCCESS:
        ++stats.success;
        CLOG_DEBUG(Simulation, "{}", outcome.toString());
        break;
    case OperationOutcome::Kind::FAILURE:
        ++stats.failure;
        CLOG_INFO(Simulation, "{}", outcome.toString());
        break;
    }
    mMetrics.at(type)->record(outcome);
    return outcome;
}

OperationStats const&
NFTSimulation::getStats(OperationType type) const
{
    return mStats.at(type);
}

OperationStats
NFTSimulation::getTotalStats() const
{
    OperationStats total;
    for (auto const& kv : mStats)
    {
        total.noOp += kv.second.noOp;
        total.success += kv.second.success;
        total.failure += kv.second.failure;
    }
    return total;
}

Json::Value
NFTSimulation::getStatus() const
{
    Json::Value root;
    auto const& header = mLedgerManager.getCurrentLedgerHeader();

    root["chain_id"] = mConfig.CHAIN_ID;
    root["seed"] = static_cast<Json::UInt64>(mConfig.SEED);
    root["ledgers_run"] = mLedgersRun;
    root["ledger_seq"] = header.ledgerSeq;
    root["close_time"] = static_cast<Json::UInt64>(header.closeTime);
    root["accounts"] = static_cast<Json::UInt64>(mAccounts.size());
    root["nfts"] = static_cast<Json::UInt64>(
        countNFTs(mLedgerManager.getRoot()));

    auto& feePool = root["fee_pool"];
    feePool = Json::Value(Json::objectValue);
    for (auto const& coin : header.feePool)
    {
        feePool[std::string(coin.denom)] =
            static_cast<Json::Int64>(coin.amount);
    }

    auto& ops = root["operations"];
    for (auto const& kv : mStats)
    {
        ops[xdr::xdr_traits<OperationType>::enum_name(kv.first)] =
            statsToJson(kv.second);
    }
    root["total"] = statsToJson(getTotalStats());

    root["halted"] = isHalted();
    if (mHaltingFailure)
    {
        root["halt_reason"] = mHaltingFailure->toString();
    }
    return root;
}

void
NFTSimulation::writeStatus(std::string const& filename) const
{
    std::ofstream out(filename);
    if (!out)
    {
        throw std::runtime_error(
            fmt::format(FMT_STRING("Error opening file '{}'"), filename));
    }
    out << getStatus().toStyledString();
    if (!out)
    {
        throw std::runtime_error(
            fmt::format(FMT_STRING("Error writing file '{}'"), filename));
    }
    CLOG_INFO(Simulation, "Wrote run summary to {}", filename);
}
}
