#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/NFT-transaction.h"

#include <memory>
#include <string>

namespace nftsim
{
class AbstractLedgerTxn;
class TransactionFrame;

class OperationFrame
{
  protected:
    Operation const& mOperation;
    TransactionFrame const& mParentTx;
    OperationResult& mResult;
    std::string mResultReason;

    virtual bool doCheckValid() = 0;
    virtual bool doApply(AbstractLedgerTxn& ltx) = 0;

    // The account that must be the source of the enclosing transaction:
    // the sender of a transfer or mint, the owner of a burn or edit.
    virtual AccountID const& getActingAccount() const = 0;

    // Records a human-readable explanation of the current result.
    void setResultReason(std::string reason);

  public:
    static std::shared_ptr<OperationFrame>
    makeHelper(Operation const& op, OperationResult& res,
               TransactionFrame const& parentTx);

    OperationFrame(Operation const& op, OperationResult& res,
                   TransactionFrame const& parentTx);
    OperationFrame(OperationFrame const&) = delete;
    virtual ~OperationFrame() = default;

    // Stateless checks only; the ledger is not consulted.
    bool checkValid();

    bool apply(AbstractLedgerTxn& ltx);

    OperationResult&
    getResult() const
    {
        return mResult;
    }
    OperationResultCode getResultCode() const;

    // Name of the most specific code in the result, for example
    // "TRANSFER_NFT_NOT_OWNER" or "opBAD_AUTH".
    std::string getResultCodeName() const;

    std::string const&
    getResultReason() const
    {
        return mResultReason;
    }

    Operation const&
    getOperation() const
    {
        return mOperation;
    }
};
}
