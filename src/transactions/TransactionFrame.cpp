// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/TransactionFrame.h"
#include "crypto/SHA.h"
#include "crypto/SecretKey.h"
#include "ledger/LedgerTxn.h"
#include "transactions/OperationFrame.h"
#include "transactions/SignatureUtils.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"
#include "util/XDROperators.h"
#include "util/types.h"

#include <fmt/format.h>
#include <set>

namespace nftsim
{

TransactionFrame::TransactionFrame(Hash const& networkID,
                                   TransactionEnvelope const& envelope)
    : mEnvelope(envelope), mNetworkID(networkID), mContentsHash()
{
    resetResults();
}

TransactionFrame::~TransactionFrame()
{
}

Hash const&
TransactionFrame::getContentsHash() const
{
    if (isZero(mContentsHash))
    {
        TransactionSignaturePayload payload;
        payload.networkId = mNetworkID;
        payload.tx = mEnvelope.tx;
        mContentsHash = xdrSha256(payload);
    }
    return mContentsHash;
}

void
TransactionFrame::addSignature(SecretKey const& secretKey)
{
    mEnvelope.signatures.emplace_back(
        SignatureUtils::sign(secretKey, getContentsHash()));
}

bool
TransactionFrame::checkSignature(AccountID const& accountID) const
{
    for (auto const& sig : mEnvelope.signatures)
    {
        if (SignatureUtils::verify(sig, accountID, getContentsHash()))
        {
            return true;
        }
    }
    return false;
}

void
TransactionFrame::resetResults()
{
    auto const& ops = mEnvelope.tx.operations;

    mResult.feeCharged.clear();
    mResult.result.code(txSUCCESS);
    mResult.result.results().resize(static_cast<uint32_t>(ops.size()));
    mResultLog.clear();

    // op frames hold references into the result vector, which must not be
    // resized while they are alive
    mOperations.clear();
    for (size_t i = 0; i < ops.size(); i++)
    {
        mOperations.push_back(OperationFrame::makeHelper(
            ops[i], mResult.result.results()[i], *this));
    }
}

void
TransactionFrame::markResultFailed(TransactionResultCode code,
                                   std::string const& reason)
{
    mResult.result.code(code);
    mResultLog = fmt::format(
        FMT_STRING("{}: {}"),
        xdr::xdr_traits<TransactionResultCode>::enum_name(code), reason);
}

void
TransactionFrame::markOperationFailed(size_t index)
{
    auto const& op = mOperations.at(index);
    mResult.result.code(txFAILED);
    mResultLog = fmt::format(
        FMT_STRING("txFAILED: operation {} ({}) failed with {}: {}"), index,
        xdr::xdr_traits<OperationType>::enum_name(
            op->getOperation().body.type()),
        op->getResultCodeName(), op->getResultReason());
}

bool
TransactionFrame::commonValidPreSeqNum()
{
    auto const& tx = mEnvelope.tx;

    if (tx.operations.empty())
    {
        markResultFailed(txMISSING_OPERATION, "transaction has no operations");
        return false;
    }

    std::set<std::string> feeDenoms;
    for (auto const& coin : tx.fee.amount)
    {
        if (!isCoinValid(coin))
        {
            markResultFailed(txMALFORMED, "invalid fee coin");
            return false;
        }
        if (!feeDenoms.insert(coin.denom).second)
        {
            markResultFailed(
                txMALFORMED,
                fmt::format(FMT_STRING("duplicate fee denom {}"),
                            std::string(coin.denom)));
            return false;
        }
    }

    if (!isStringValid(tx.memo))
    {
        markResultFailed(txMALFORMED, "memo contains control characters");
        return false;
    }

    for (size_t i = 0; i < mOperations.size(); i++)
    {
        if (!mOperations[i]->checkValid())
        {
            markOperationFailed(i);
            return false;
        }
    }
    return true;
}

bool
TransactionFrame::commonValid(AbstractLedgerTxn& ltx)
{
    auto const& tx = mEnvelope.tx;

    auto account = loadAccount(ltx, getSourceID());
    if (!account)
    {
        markResultFailed(
            txNO_ACCOUNT,
            fmt::format(FMT_STRING("source account {} not found"),
                        KeyUtils::toHexString(getSourceID())));
        return false;
    }
    auto const& ae = account->data.account();

    if (ae.accountNumber != tx.accountNumber)
    {
        markResultFailed(
            txBAD_ACCOUNT_NUMBER,
            fmt::format(
                FMT_STRING("account number {}, transaction account number {}"),
                ae.accountNumber, tx.accountNumber));
        return false;
    }

    if (ae.seqNum != tx.seqNum)
    {
        markResultFailed(
            txBAD_SEQ,
            fmt::format(FMT_STRING("account sequence {}, transaction "
                                   "sequence {}"),
                        ae.seqNum, tx.seqNum));
        return false;
    }

    if (!checkSignature(getSourceID()))
    {
        markResultFailed(
            txBAD_AUTH,
            fmt::format(FMT_STRING("no valid signature for {}"),
                        KeyUtils::toHexString(getSourceID())));
        return false;
    }

    auto now = ltx.getHeader().closeTime;
    for (auto const& coin : tx.fee.amount)
    {
        auto spendable = getSpendableBalance(ae, coin.denom, now);
        if (spendable < coin.amount)
        {
            markResultFailed(
                txINSUFFICIENT_BALANCE,
                fmt::format(FMT_STRING("fee {}{} exceeds spendable {}{}"),
                            coin.amount, std::string(coin.denom), spendable,
                            std::string(coin.denom)));
            return false;
        }
    }
    return true;
}

void
TransactionFrame::processFeeSeqNum(AbstractLedgerTxn& ltx)
{
    auto const& fee = mEnvelope.tx.fee.amount;

    auto account = loadAccount(ltx, getSourceID());
    if (!account)
    {
        throw std::runtime_error("Unexpected database state");
    }
    auto& ae = account->data.account();
    for (auto const& coin : fee)
    {
        if (!addBalance(ae.balances, coin.denom, -coin.amount))
        {
            throw std::runtime_error("fee exceeds balance");
        }
    }
    ++ae.seqNum;
    ltx.update(*account);

    auto& header = ltx.loadHeader();
    for (auto const& coin : fee)
    {
        if (!addBalance(header.feePool, coin.denom, coin.amount))
        {
            throw std::runtime_error("fee pool overflow");
        }
    }

    mResult.feeCharged = fee;
}

bool
TransactionFrame::applyOperations(AbstractLedgerTxn& ltx)
{
    for (size_t i = 0; i < mOperations.size(); i++)
    {
        if (!mOperations[i]->apply(ltx))
        {
            markOperationFailed(i);
            return false;
        }
    }
    return true;
}

bool
TransactionFrame::apply(AbstractLedgerTxn& ltx)
{
    resetResults();

    if (!commonValidPreSeqNum())
    {
        CLOG_DEBUG(Tx, "Rejected malformed transaction: {}", mResultLog);
        return false;
    }

    {
        // validation reads go through a child so a rejection leaves `ltx`
        // exactly as it was
        LedgerTxn ltxValid(ltx);
        if (!commonValid(ltxValid))
        {
            CLOG_DEBUG(Tx, "Rejected transaction: {}", mResultLog);
            return false;
        }
        processFeeSeqNum(ltxValid);
        ltxValid.commit();
    }

    LedgerTxn ltxOps(ltx);
    if (!applyOperations(ltxOps))
    {
        CLOG_DEBUG(Tx, "Transaction failed: {}", mResultLog);
        return false;
    }
    ltxOps.commit();

    mResult.result.code(txSUCCESS);
    mResultLog = "txSUCCESS";
    return true;
}
}
