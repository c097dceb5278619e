#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/NFT-transaction.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace nftsim
{

enum class FailureCategory
{
    // the acting address has no signing key or no ledger account
    ACCOUNT_RESOLUTION,
    // no spendable coin to pay a fee with
    FEE_COMPUTATION,
    // the ledger rejected the transaction
    EXECUTION_REJECTED
};

std::string toString(FailureCategory category);

// Base of the errors an operation can hit before anything is submitted.
// NFTOperation::invoke turns them into a failed OperationOutcome.
class OperationError : public std::runtime_error
{
    FailureCategory const mCategory;

  public:
    OperationError(FailureCategory category, std::string const& msg)
        : std::runtime_error(msg), mCategory(category)
    {
    }

    FailureCategory
    getCategory() const
    {
        return mCategory;
    }
};

class AccountNotFoundError : public OperationError
{
  public:
    explicit AccountNotFoundError(std::string const& msg)
        : OperationError(FailureCategory::ACCOUNT_RESOLUTION, msg)
    {
    }
};

class InsufficientFundsError : public OperationError
{
  public:
    explicit InsufficientFundsError(std::string const& msg)
        : OperationError(FailureCategory::FEE_COMPUTATION, msg)
    {
    }
};

// The result of one NFTOperation invocation.
struct OperationOutcome
{
    enum class Kind
    {
        NO_OP,
        SUCCESS,
        FAILURE
    };

    Kind kind;
    OperationType type;

    // The request that was submitted. Set for SUCCESS and for rejected
    // submissions; empty when nothing was built.
    std::optional<Operation> request;

    // NO_OP: why nothing was eligible. FAILURE: the error message, or the
    // ledger's log verbatim for rejections.
    std::string reason;

    std::optional<FailureCategory> category;

    static OperationOutcome noOp(OperationType type, std::string reason);
    static OperationOutcome success(Operation const& request);
    static OperationOutcome failure(OperationType type,
                                    FailureCategory category,
                                    std::string reason,
                                    std::optional<Operation> request = {});

    bool
    isNoOp() const
    {
        return kind == Kind::NO_OP;
    }
    bool
    isSuccess() const
    {
        return kind == Kind::SUCCESS;
    }
    bool
    isFailure() const
    {
        return kind == Kind::FAILURE;
    }

    std::string toString() const;
};

std::string toString(OperationOutcome::Kind kind);
}
