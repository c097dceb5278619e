// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/BurnNFTOpFrame.h"
#include "crypto/SecretKey.h"
#include "ledger/LedgerTxn.h"
#include "ledger/LedgerTypeUtils.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"
#include "util/XDROperators.h"

#include <fmt/format.h>

namespace nftsim
{

BurnNFTOpFrame::BurnNFTOpFrame(Operation const& op, OperationResult& res,
                               TransactionFrame const& parentTx)
    : OperationFrame(op, res, parentTx), mBurnNFT(mOperation.body.burnNFTOp())
{
}

AccountID const&
BurnNFTOpFrame::getActingAccount() const
{
    return mBurnNFT.owner;
}

bool
BurnNFTOpFrame::doApply(AbstractLedgerTxn& ltx)
{
    auto nft = nftsim::loadNFT(ltx, mBurnNFT.denom, mBurnNFT.id);
    if (!nft)
    {
        innerResult().code(BURN_NFT_NOT_FOUND);
        setResultReason(fmt::format(FMT_STRING("nft {} not found"),
                                    nftName(mBurnNFT.denom, mBurnNFT.id)));
        return false;
    }

    if (!(nft->data.nft().owner == mBurnNFT.owner))
    {
        innerResult().code(BURN_NFT_NOT_OWNER);
        setResultReason(
            fmt::format(FMT_STRING("{} is not the owner of nft {}"),
                        KeyUtils::toShortString(mBurnNFT.owner),
                        nftName(mBurnNFT.denom, mBurnNFT.id)));
        return false;
    }

    ltx.erase(LedgerEntryKey(*nft));

    CLOG_DEBUG(Tx, "Burned {}", nftName(mBurnNFT.denom, mBurnNFT.id));
    innerResult().code(BURN_NFT_SUCCESS);
    return true;
}

bool
BurnNFTOpFrame::doCheckValid()
{
    if (!isNFTStringValid(mBurnNFT.denom) || !isNFTStringValid(mBurnNFT.id))
    {
        innerResult().code(BURN_NFT_MALFORMED);
        setResultReason("denom and id must be non-blank");
        return false;
    }
    return true;
}
}
