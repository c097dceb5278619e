// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/LedgerManager.h"
#include "crypto/SHA.h"
#include "crypto/SecretKey.h"
#include "transactions/TransactionFrame.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"

#include <fmt/format.h>
#include <medida/counter.h>
#include <medida/metrics_registry.h>

namespace nftsim
{

const uint32_t LedgerManager::GENESIS_LEDGER_SEQ = 1;

namespace
{
LedgerHeader
genesisHeader(TimePoint closeTime)
{
    LedgerHeader header;
    header.ledgerSeq = LedgerManager::GENESIS_LEDGER_SEQ;
    header.closeTime = closeTime;
    header.nextAccountNumber = 0;
    return header;
}
}

LedgerManager::LedgerManager(std::string const& chainID,
                             TimePoint genesisCloseTime,
                             medida::MetricsRegistry& metrics)
    : mChainID(chainID)
    , mNetworkID(sha256(chainID))
    , mRoot(genesisHeader(genesisCloseTime))
    , mTransactionApplySucceeded(
          metrics.NewCounter({"ledger", "apply", "success"}))
    , mTransactionApplyFailed(
          metrics.NewCounter({"ledger", "apply", "failure"}))
{
}

std::string const&
LedgerManager::getChainID() const
{
    return mChainID;
}

Hash const&
LedgerManager::getNetworkID() const
{
    return mNetworkID;
}

AbstractLedgerTxnParent&
LedgerManager::getRoot()
{
    return mRoot;
}

AbstractLedgerTxnParent const&
LedgerManager::getRoot() const
{
    return mRoot;
}

LedgerHeader const&
LedgerManager::getCurrentLedgerHeader() const
{
    return mRoot.getHeader();
}

void
LedgerManager::closeLedger(TimePoint closeTime)
{
    auto const& current = mRoot.getHeader();
    if (closeTime < current.closeTime)
    {
        throw std::invalid_argument(fmt::format(
            FMT_STRING("close time {} is before current close time {}"),
            closeTime, current.closeTime));
    }

    LedgerTxn ltx(mRoot);
    auto& header = ltx.loadHeader();
    ++header.ledgerSeq;
    header.closeTime = closeTime;
    ltx.commit();

    CLOG_DEBUG(Ledger, "Started ledger {} at close time {}",
               mRoot.getHeader().ledgerSeq, mRoot.getHeader().closeTime);
}

TransactionApplyResult
LedgerManager::applyTransaction(TransactionEnvelope const& envelope)
{
    TransactionFrame frame(mNetworkID, envelope);

    TransactionApplyResult res;
    LedgerTxn ltx(mRoot);
    res.ok = frame.apply(ltx);
    ltx.commit();

    res.log = frame.getResultLog();
    res.result = frame.getResult();

    if (res.ok)
    {
        mTransactionApplySucceeded.inc();
    }
    else
    {
        mTransactionApplyFailed.inc();
    }
    CLOG_TRACE(Ledger, "Applied tx from {} seq {} in ledger {}: {}",
               KeyUtils::toShortString(frame.getSourceID()),
               frame.getSeqNum(), mRoot.getHeader().ledgerSeq, res.log);
    return res;
}

LedgerEntry
LedgerManager::createAccount(AccountID const& accountID,
                             std::vector<Coin> const& balances,
                             VestingSchedule const* vesting)
{
    LedgerTxn ltx(mRoot);
    auto le = nftsim::createAccount(ltx, accountID, balances, vesting);
    ltx.commit();
    return le;
}

LedgerEntry
LedgerManager::createNFT(std::string const& denom, std::string const& id,
                         AccountID const& owner, std::string const& tokenURI)
{
    LedgerTxn ltx(mRoot);
    auto le = nftsim::createNFT(ltx, denom, id, owner, tokenURI);
    ltx.commit();
    return le;
}
}
