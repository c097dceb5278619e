// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/OperationFrame.h"
#include "crypto/SecretKey.h"
#include "ledger/LedgerTxn.h"
#include "transactions/BurnNFTOpFrame.h"
#include "transactions/EditNFTMetadataOpFrame.h"
#include "transactions/MintNFTOpFrame.h"
#include "transactions/TransactionFrame.h"
#include "transactions/TransferNFTOpFrame.h"
#include "util/Logging.h"
#include "util/XDROperators.h"

#include <fmt/format.h>
#include <xdrpp/printer.h>

namespace nftsim
{

std::shared_ptr<OperationFrame>
OperationFrame::makeHelper(Operation const& op, OperationResult& res,
                           TransactionFrame const& tx)
{
    switch (op.body.type())
    {
    case MINT_NFT:
        return std::make_shared<MintNFTOpFrame>(op, res, tx);
    case BURN_NFT:
        return std::make_shared<BurnNFTOpFrame>(op, res, tx);
    case TRANSFER_NFT:
        return std::make_shared<TransferNFTOpFrame>(op, res, tx);
    case EDIT_NFT_METADATA:
        return std::make_shared<EditNFTMetadataOpFrame>(op, res, tx);
    default:
        throw std::runtime_error(
            fmt::format(FMT_STRING("Unknown operation type {}"),
                        static_cast<int32_t>(op.body.type())));
    }
}

OperationFrame::OperationFrame(Operation const& op, OperationResult& res,
                               TransactionFrame const& parentTx)
    : mOperation(op), mParentTx(parentTx), mResult(res)
{
    mResult.code(opINNER);
    mResult.tr().type(mOperation.body.type());
}

void
OperationFrame::setResultReason(std::string reason)
{
    mResultReason = std::move(reason);
}

bool
OperationFrame::checkValid()
{
    mResult.code(opINNER);
    mResult.tr().type(mOperation.body.type());
    mResultReason.clear();
    return doCheckValid();
}

bool
OperationFrame::apply(AbstractLedgerTxn& ltx)
{
    if (!checkValid())
    {
        return false;
    }

    if (!(getActingAccount() == mParentTx.getSourceID()))
    {
        mResult.code(opBAD_AUTH);
        setResultReason(fmt::format(
            FMT_STRING("account {} cannot act for {}"),
            KeyUtils::toShortString(mParentTx.getSourceID()),
            KeyUtils::toShortString(getActingAccount())));
        return false;
    }

    bool res = doApply(ltx);
    CLOG_TRACE(Tx, "{}", xdr::xdr_to_string(mOperation, "Operation"));
    return res;
}

OperationResultCode
OperationFrame::getResultCode() const
{
    return mResult.code();
}

std::string
OperationFrame::getResultCodeName() const
{
    if (mResult.code() != opINNER)
    {
        return xdr::xdr_traits<OperationResultCode>::enum_name(mResult.code());
    }

    auto const& tr = mResult.tr();
    switch (tr.type())
    {
    case MINT_NFT:
        return xdr::xdr_traits<MintNFTResultCode>::enum_name(
            tr.mintNFTResult().code());
    case BURN_NFT:
        return xdr::xdr_traits<BurnNFTResultCode>::enum_name(
            tr.burnNFTResult().code());
    case TRANSFER_NFT:
        return xdr::xdr_traits<TransferNFTResultCode>::enum_name(
            tr.transferNFTResult().code());
    case EDIT_NFT_METADATA:
        return xdr::xdr_traits<EditNFTMetadataResultCode>::enum_name(
            tr.editNFTMetadataResult().code());
    }
    return "UNKNOWN";
}
}
