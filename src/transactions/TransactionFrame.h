#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/NFT-transaction.h"

#include <memory>
#include <string>
#include <vector>

namespace nftsim
{
class AbstractLedgerTxn;
class OperationFrame;
class SecretKey;

class TransactionFrame
{
  protected:
    TransactionEnvelope mEnvelope;
    Hash const mNetworkID;
    mutable Hash mContentsHash; // the hash the signatures are over

    TransactionResult mResult;
    std::string mResultLog;

    std::vector<std::shared_ptr<OperationFrame>> mOperations;

    void resetResults();

    // Sets a code that carries no per-operation results, with `reason` as the
    // human-readable part of the log.
    void markResultFailed(TransactionResultCode code,
                          std::string const& reason);

    // Sets txFAILED, blaming the operation at `index`.
    void markOperationFailed(size_t index);

    // Checks that need no ledger access.
    bool commonValidPreSeqNum();

    // Account, sequence, signature and fee checks against `ltx`.
    bool commonValid(AbstractLedgerTxn& ltx);

    // Takes the fee from the source account into the fee pool and consumes
    // the sequence number.
    void processFeeSeqNum(AbstractLedgerTxn& ltx);

    bool applyOperations(AbstractLedgerTxn& ltx);

  public:
    TransactionFrame(Hash const& networkID,
                     TransactionEnvelope const& envelope);
    TransactionFrame(TransactionFrame const&) = delete;
    TransactionFrame() = delete;
    virtual ~TransactionFrame();

    Hash const& getContentsHash() const;

    TransactionEnvelope const&
    getEnvelope() const
    {
        return mEnvelope;
    }

    AccountID const&
    getSourceID() const
    {
        return mEnvelope.tx.sourceAccount;
    }

    SequenceNumber
    getSeqNum() const
    {
        return mEnvelope.tx.seqNum;
    }

    TransactionResult const&
    getResult() const
    {
        return mResult;
    }

    TransactionResultCode
    getResultCode() const
    {
        return mResult.result.code();
    }

    // Single-line description of the result, for example
    // "txBAD_SEQ: account sequence 3, transaction sequence 5".
    std::string const&
    getResultLog() const
    {
        return mResultLog;
    }

    std::vector<std::shared_ptr<OperationFrame>> const&
    getOperations() const
    {
        return mOperations;
    }

    void addSignature(SecretKey const& secretKey);

    // true if one of the signatures is a valid signature by `accountID`
    bool checkSignature(AccountID const& accountID) const;

    // Validates and applies the transaction into `ltx`. Rejected
    // transactions leave `ltx` untouched. Once the fee is charged the fee and
    // sequence number changes stay in `ltx` even if an operation fails, while
    // the operations' own changes are discarded. Returns true on txSUCCESS.
    bool apply(AbstractLedgerTxn& ltx);
};
}
