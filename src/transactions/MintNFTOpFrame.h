#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/OperationFrame.h"

namespace nftsim
{
class AbstractLedgerTxn;

class MintNFTOpFrame : public OperationFrame
{
    MintNFTResult&
    innerResult()
    {
        return mResult.tr().mintNFTResult();
    }

    MintNFTOp const& mMintNFT;

    AccountID const& getActingAccount() const override;

  public:
    MintNFTOpFrame(Operation const& op, OperationResult& res,
                   TransactionFrame const& parentTx);

    bool doApply(AbstractLedgerTxn& ltx) override;
    bool doCheckValid() override;

    static MintNFTResultCode
    getInnerCode(OperationResult const& res)
    {
        return res.tr().mintNFTResult().code();
    }
};
}
