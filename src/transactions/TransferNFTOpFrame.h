#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/OperationFrame.h"

namespace nftsim
{
class AbstractLedgerTxn;

class TransferNFTOpFrame : public OperationFrame
{
    TransferNFTResult&
    innerResult()
    {
        return mResult.tr().transferNFTResult();
    }

    TransferNFTOp const& mTransferNFT;

    AccountID const& getActingAccount() const override;

  public:
    TransferNFTOpFrame(Operation const& op, OperationResult& res,
                       TransactionFrame const& parentTx);

    bool doApply(AbstractLedgerTxn& ltx) override;
    bool doCheckValid() override;

    static TransferNFTResultCode
    getInnerCode(OperationResult const& res)
    {
        return res.tr().transferNFTResult().code();
    }
};
}
