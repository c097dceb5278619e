#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/OperationFrame.h"

namespace nftsim
{
class AbstractLedgerTxn;

class EditNFTMetadataOpFrame : public OperationFrame
{
    EditNFTMetadataResult&
    innerResult()
    {
        return mResult.tr().editNFTMetadataResult();
    }

    EditNFTMetadataOp const& mEditNFTMetadata;

    AccountID const& getActingAccount() const override;

  public:
    EditNFTMetadataOpFrame(Operation const& op, OperationResult& res,
                           TransactionFrame const& parentTx);

    bool doApply(AbstractLedgerTxn& ltx) override;
    bool doCheckValid() override;

    static EditNFTMetadataResultCode
    getInnerCode(OperationResult const& res)
    {
        return res.tr().editNFTMetadataResult().code();
    }
};
}
