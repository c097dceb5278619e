#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/OperationOutcome.h"
#include "xdr/NFT-transaction.h"

#include <cstdint>
#include <string>
#include <vector>

namespace nftsim
{

class LedgerManager;
class SecretKey;

namespace TxSubmitter
{
// Gas limit of every generated transaction.
static const uint64_t GAS_LIMIT = 1000000;

// Wraps `op` in a single-operation transaction with an empty memo and signs
// it for the chain `chainID`.
TransactionEnvelope buildAndSign(Operation const& op,
                                 std::vector<Coin> const& fee,
                                 std::string const& chainID,
                                 uint64_t accountNumber,
                                 SequenceNumber sequence,
                                 SecretKey const& secretKey);

// Applies `envelope` through `ledger`. txSUCCESS gives a SUCCESS outcome
// carrying `op`; anything else a FAILURE carrying the ledger's log.
OperationOutcome submit(LedgerManager& ledger, Operation const& op,
                        TransactionEnvelope const& envelope);
}
}
