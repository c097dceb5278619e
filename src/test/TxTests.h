#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "ledger/LedgerManager.h"
#include "xdr/NFT-transaction.h"

#include <string>
#include <vector>

namespace nftsim
{
namespace txtest
{

// Deterministic key derived from a name.
SecretKey getAccount(std::string const& n);

Coin makeCoin(std::string const& denom, int64_t amount);

Operation mintNFT(PublicKey const& sender, PublicKey const& recipient,
                  std::string const& denom, std::string const& id,
                  std::string const& tokenURI);

Operation burnNFT(PublicKey const& owner, std::string const& denom,
                  std::string const& id);

Operation transferNFT(PublicKey const& sender, PublicKey const& recipient,
                      std::string const& denom, std::string const& id);

Operation editNFTMetadata(PublicKey const& owner, std::string const& denom,
                          std::string const& id, std::string const& tokenURI);

// Builds a transaction from `from` using its current account number and
// sequence, signed for the ledger's network.
TransactionEnvelope
transactionFromOperations(LedgerManager& lm, SecretKey const& from,
                          std::vector<Operation> const& ops,
                          std::vector<Coin> const& fee);

TransactionEnvelope transactionFromOperations(
    Hash const& networkID, SecretKey const& from, uint64_t accountNumber,
    SequenceNumber seqNum, std::vector<Operation> const& ops,
    std::vector<Coin> const& fee);

// Result of the first operation of a txSUCCESS or txFAILED result.
OperationResult const& getFirstResult(TransactionResult const& result);
}
}
