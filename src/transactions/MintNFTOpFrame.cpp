// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/MintNFTOpFrame.h"
#include "crypto/SecretKey.h"
#include "ledger/LedgerTxn.h"
#include "ledger/LedgerTypeUtils.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"
#include "util/types.h"

#include <fmt/format.h>

namespace nftsim
{

MintNFTOpFrame::MintNFTOpFrame(Operation const& op, OperationResult& res,
                               TransactionFrame const& parentTx)
    : OperationFrame(op, res, parentTx), mMintNFT(mOperation.body.mintNFTOp())
{
}

AccountID const&
MintNFTOpFrame::getActingAccount() const
{
    return mMintNFT.sender;
}

bool
MintNFTOpFrame::doApply(AbstractLedgerTxn& ltx)
{
    if (nftsim::loadNFT(ltx, mMintNFT.denom, mMintNFT.id))
    {
        innerResult().code(MINT_NFT_ALREADY_EXISTS);
        setResultReason(fmt::format(FMT_STRING("nft {} already exists"),
                                    nftName(mMintNFT.denom, mMintNFT.id)));
        return false;
    }

    createNFT(ltx, mMintNFT.denom, mMintNFT.id, mMintNFT.recipient,
              mMintNFT.tokenURI);

    CLOG_DEBUG(Tx, "Minted {} to {}", nftName(mMintNFT.denom, mMintNFT.id),
               KeyUtils::toShortString(mMintNFT.recipient));
    innerResult().code(MINT_NFT_SUCCESS);
    return true;
}

bool
MintNFTOpFrame::doCheckValid()
{
    if (!isNFTStringValid(mMintNFT.denom) || !isNFTStringValid(mMintNFT.id))
    {
        innerResult().code(MINT_NFT_MALFORMED);
        setResultReason("denom and id must be non-blank");
        return false;
    }
    if (!isStringValid(mMintNFT.tokenURI))
    {
        innerResult().code(MINT_NFT_MALFORMED);
        setResultReason("token uri contains control characters");
        return false;
    }
    return true;
}
}
