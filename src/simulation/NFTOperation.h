#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/NFTSampler.h"
#include "simulation/OperationOutcome.h"
#include "simulation/SimAccount.h"
#include "util/Math.h"
#include "xdr/NFT-transaction.h"

#include <memory>
#include <optional>
#include <string>

namespace nftsim
{

class AbstractLedgerTxnParent;
class LedgerManager;

/**
 * Generates one random NFT operation per call to invoke() and submits it to a
 * ledger. Every kind goes through the same pipeline:
 *
 *  1. sample() picks what to act on. Nothing eligible ends the invocation
 *     with a NO_OP outcome.
 *  2. The acting account is resolved and a random affordable fee is drawn
 *     from its spendable balance. Errors end the invocation with a FAILURE
 *     outcome and nothing is submitted.
 *  3. buildOperation() fills in the request, drawing any free-form strings.
 *  4. The request is signed and applied; the ledger's verdict decides between
 *     SUCCESS and FAILURE.
 *
 * Exactly one outcome is produced per invocation and nothing is retried. All
 * randomness comes from the engine passed in.
 */
class NFTOperation
{
  protected:
    // What sample() selected. `actor` signs and pays.
    struct Subject
    {
        AccountID actor;
        AccountID recipient;
        std::optional<NFTRef> nft;
    };

    virtual std::optional<Subject>
    sample(nftsim_default_random_engine& engine,
           AbstractLedgerTxnParent const& ledger,
           SimAccounts const& accounts) const = 0;

    virtual Operation buildOperation(nftsim_default_random_engine& engine,
                                     Subject const& subject) const = 0;

  public:
    virtual ~NFTOperation() = default;

    virtual OperationType getType() const = 0;

    OperationOutcome invoke(nftsim_default_random_engine& engine,
                            LedgerManager& ledger, SimAccounts const& accounts,
                            std::string const& chainID) const;
};

std::unique_ptr<NFTOperation> makeNFTOperation(OperationType type);
}
