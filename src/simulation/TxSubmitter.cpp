// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/TxSubmitter.h"
#include "crypto/SHA.h"
#include "crypto/SecretKey.h"
#include "ledger/LedgerManager.h"
#include "transactions/TransactionFrame.h"
#include "util/Logging.h"

namespace nftsim
{
namespace TxSubmitter
{

TransactionEnvelope
buildAndSign(Operation const& op, std::vector<Coin> const& fee,
             std::string const& chainID, uint64_t accountNumber,
             SequenceNumber sequence, SecretKey const& secretKey)
{
    TransactionEnvelope envelope;
    auto& tx = envelope.tx;
    tx.sourceAccount = secretKey.getPublicKey();
    tx.accountNumber = accountNumber;
    tx.seqNum = sequence;
    tx.fee.amount.assign(fee.begin(), fee.end());
    tx.fee.gas = GAS_LIMIT;
    tx.operations.emplace_back(op);

    TransactionFrame frame(sha256(chainID), envelope);
    frame.addSignature(secretKey);
    return frame.getEnvelope();
}

OperationOutcome
submit(LedgerManager& ledger, Operation const& op,
       TransactionEnvelope const& envelope)
{
    auto res = ledger.applyTransaction(envelope);
    if (res.ok)
    {
        return OperationOutcome::success(op);
    }
    return OperationOutcome::failure(op.body.type(),
                                     FailureCategory::EXECUTION_REJECTED,
                                     res.log, op);
}
}
}
