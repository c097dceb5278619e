#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/LedgerTxn.h"
#include "util/NonCopyable.h"
#include "xdr/NFT-transaction.h"

#include <string>
#include <vector>

namespace medida
{
class Counter;
class MetricsRegistry;
}

namespace nftsim
{

struct TransactionApplyResult
{
    bool ok{false};
    // Single-line diagnostic from the transaction frame, for example
    // "txFAILED: operation 0 (TRANSFER_NFT) failed with ...".
    std::string log;
    TransactionResult result;
};

/**
 * LedgerManager owns the committed ledger state of one simulated chain and is
 * the only path through which transactions reach it.
 *
 * The header it holds describes the ledger currently being built: its
 * sequence number and the close time that transactions applied to it observe.
 * closeLedger() seals that ledger and starts the next one.
 *
 * There is no global instance; every simulation (and every test) creates its
 * own.
 */
class LedgerManager : public NonMovableOrCopyable
{
    std::string const mChainID;
    Hash const mNetworkID;
    InMemoryLedgerState mRoot;

    medida::Counter& mTransactionApplySucceeded;
    medida::Counter& mTransactionApplyFailed;

  public:
    static const uint32_t GENESIS_LEDGER_SEQ;

    LedgerManager(std::string const& chainID, TimePoint genesisCloseTime,
                  medida::MetricsRegistry& metrics);

    std::string const& getChainID() const;

    // sha256 of the chain id; transaction signatures commit to it.
    Hash const& getNetworkID() const;

    AbstractLedgerTxnParent& getRoot();
    AbstractLedgerTxnParent const& getRoot() const;

    LedgerHeader const& getCurrentLedgerHeader() const;

    // Starts the next ledger with the given close time. Throws if time would
    // go backwards.
    void closeLedger(TimePoint closeTime);

    // Validates and applies a single transaction envelope against the
    // current ledger.
    TransactionApplyResult applyTransaction(TransactionEnvelope const& envelope);

    // Genesis helpers, bypassing transaction validation.
    LedgerEntry createAccount(AccountID const& accountID,
                              std::vector<Coin> const& balances,
                              VestingSchedule const* vesting);
    LedgerEntry createNFT(std::string const& denom, std::string const& id,
                          AccountID const& owner, std::string const& tokenURI);
};
}
