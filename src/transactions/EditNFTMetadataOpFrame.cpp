// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/EditNFTMetadataOpFrame.h"
#include "crypto/SecretKey.h"
#include "ledger/LedgerTxn.h"
#include "ledger/LedgerTypeUtils.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"
#include "util/XDROperators.h"
#include "util/types.h"

#include <fmt/format.h>

namespace nftsim
{

EditNFTMetadataOpFrame::EditNFTMetadataOpFrame(
    Operation const& op, OperationResult& res,
    TransactionFrame const& parentTx)
    : OperationFrame(op, res, parentTx)
    , mEditNFTMetadata(mOperation.body.editNFTMetadataOp())
{
}

AccountID const&
EditNFTMetadataOpFrame::getActingAccount() const
{
    return mEditNFTMetadata.owner;
}

bool
EditNFTMetadataOpFrame::doApply(AbstractLedgerTxn& ltx)
{
    auto nft =
        nftsim::loadNFT(ltx, mEditNFTMetadata.denom, mEditNFTMetadata.id);
    if (!nft)
    {
        innerResult().code(EDIT_NFT_METADATA_NOT_FOUND);
        setResultReason(
            fmt::format(FMT_STRING("nft {} not found"),
                        nftName(mEditNFTMetadata.denom, mEditNFTMetadata.id)));
        return false;
    }

    auto& nftEntry = nft->data.nft();
    if (!(nftEntry.owner == mEditNFTMetadata.owner))
    {
        innerResult().code(EDIT_NFT_METADATA_NOT_OWNER);
        setResultReason(
            fmt::format(FMT_STRING("{} is not the owner of nft {}"),
                        KeyUtils::toShortString(mEditNFTMetadata.owner),
                        nftName(mEditNFTMetadata.denom, mEditNFTMetadata.id)));
        return false;
    }

    nftEntry.tokenURI = mEditNFTMetadata.tokenURI;
    ltx.update(*nft);

    innerResult().code(EDIT_NFT_METADATA_SUCCESS);
    return true;
}

bool
EditNFTMetadataOpFrame::doCheckValid()
{
    if (!isNFTStringValid(mEditNFTMetadata.denom) ||
        !isNFTStringValid(mEditNFTMetadata.id) ||
        !isStringValid(mEditNFTMetadata.tokenURI))
    {
        innerResult().code(EDIT_NFT_METADATA_MALFORMED);
        setResultReason("malformed denom, id or token uri");
        return false;
    }
    return true;
}
}
