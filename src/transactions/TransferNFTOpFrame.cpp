// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/TransferNFTOpFrame.h"
#include "crypto/SecretKey.h"
#include "ledger/LedgerTxn.h"
#include "ledger/LedgerTypeUtils.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"
#include "util/XDROperators.h"

#include <fmt/format.h>

namespace nftsim
{

TransferNFTOpFrame::TransferNFTOpFrame(Operation const& op,
                                       OperationResult& res,
                                       TransactionFrame const& parentTx)
    : OperationFrame(op, res, parentTx)
    , mTransferNFT(mOperation.body.transferNFTOp())
{
}

AccountID const&
TransferNFTOpFrame::getActingAccount() const
{
    return mTransferNFT.sender;
}

bool
TransferNFTOpFrame::doApply(AbstractLedgerTxn& ltx)
{
    auto nft = nftsim::loadNFT(ltx, mTransferNFT.denom, mTransferNFT.id);
    if (!nft)
    {
        innerResult().code(TRANSFER_NFT_NOT_FOUND);
        setResultReason(
            fmt::format(FMT_STRING("nft {} not found"),
                        nftName(mTransferNFT.denom, mTransferNFT.id)));
        return false;
    }

    auto& nftEntry = nft->data.nft();
    if (!(nftEntry.owner == mTransferNFT.sender))
    {
        innerResult().code(TRANSFER_NFT_NOT_OWNER);
        setResultReason(
            fmt::format(FMT_STRING("{} is not the owner of nft {}"),
                        KeyUtils::toShortString(mTransferNFT.sender),
                        nftName(mTransferNFT.denom, mTransferNFT.id)));
        return false;
    }

    // sending to oneself is allowed and leaves the owner unchanged
    nftEntry.owner = mTransferNFT.recipient;
    ltx.update(*nft);

    CLOG_DEBUG(Tx, "Transferred {} from {} to {}",
               nftName(mTransferNFT.denom, mTransferNFT.id),
               KeyUtils::toShortString(mTransferNFT.sender),
               KeyUtils::toShortString(mTransferNFT.recipient));
    innerResult().code(TRANSFER_NFT_SUCCESS);
    return true;
}

bool
TransferNFTOpFrame::doCheckValid()
{
    if (!isNFTStringValid(mTransferNFT.denom) ||
        !isNFTStringValid(mTransferNFT.id))
    {
        innerResult().code(TRANSFER_NFT_MALFORMED);
        setResultReason("denom and id must be non-blank");
        return false;
    }
    return true;
}
}
