// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/OperationOutcome.h"

#include <fmt/format.h>

namespace nftsim
{

std::string
toString(FailureCategory category)
{
    switch (category)
    {
    case FailureCategory::ACCOUNT_RESOLUTION:
        return "account-resolution";
    case FailureCategory::FEE_COMPUTATION:
        return "fee-computation";
    case FailureCategory::EXECUTION_REJECTED:
        return "execution-rejected";
    }
    return "unknown";
}

std::string
toString(OperationOutcome::Kind kind)
{
    switch (kind)
    {
    case OperationOutcome::Kind::NO_OP:
        return "noop";
    case OperationOutcome::Kind::SUCCESS:
        return "success";
    case OperationOutcome::Kind::FAILURE:
        return "failure";
    }
    return "unknown";
}

OperationOutcome
OperationOutcome::noOp(OperationType type, std::string reason)
{
    OperationOutcome res;
    res.kind = Kind::NO_OP;
    res.type = type;
    res.reason = std::move(reason);
    return res;
}

OperationOutcome
OperationOutcome::success(Operation const& request)
{
    OperationOutcome res;
    res.kind = Kind::SUCCESS;
    res.type = request.body.type();
    res.request = request;
    return res;
}

OperationOutcome
OperationOutcome::failure(OperationType type, FailureCategory category,
                          std::string reason,
                          std::optional<Operation> request)
{
    OperationOutcome res;
    res.kind = Kind::FAILURE;
    res.type = type;
    res.category = category;
    res.reason = std::move(reason);
    res.request = std::move(request);
    return res;
}

std::string
OperationOutcome::toString() const
{
    auto typeName = xdr::xdr_traits<OperationType>::enum_name(type);
    switch (kind)
    {
    case Kind::NO_OP:
        return fmt::format(FMT_STRING("{} noop: {}"), typeName, reason);
    case Kind::SUCCESS:
        return fmt::format(FMT_STRING("{} success"), typeName);
    case Kind::FAILURE:
        return fmt::format(FMT_STRING("{} failure ({}): {}"), typeName,
                           nftsim::toString(*category), reason);
    }
    return typeName;
}
}
