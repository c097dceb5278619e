// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "simulation/NFTOperation.h"
#include "ledger/LedgerManager.h"
#include "simulation/FeeResolver.h"
#include "simulation/TxSubmitter.h"
#include "util/Logging.h"

#include <fmt/format.h>

namespace nftsim
{

namespace
{
size_t const NFT_ID_LENGTH = 10;
size_t const NFT_DENOM_LENGTH = 10;
size_t const TOKEN_URI_LENGTH = 45;

class TransferNFTOperation : public NFTOperation
{
  protected:
    std::optional<Subject>
    sample(nftsim_default_random_engine& engine,
           AbstractLedgerTxnParent const& ledger,
           SimAccounts const& accounts) const override
    {
        if (accounts.empty())
        {
            return std::nullopt;
        }
        auto nft = NFTSampler::randomOwnedNFT(ledger, engine);
        if (!nft)
        {
            return std::nullopt;
        }
        // may pick the current owner
        auto const& recipient = randomAccount(accounts, engine);
        return Subject{nft->owner, recipient.getAddress(), nft};
    }

    Operation
    buildOperation(nftsim_default_random_engine&,
                   Subject const& subject) const override
    {
        Operation op;
        op.body.type(TRANSFER_NFT);
        auto& transfer = op.body.transferNFTOp();
        transfer.sender = subject.actor;
        transfer.recipient = subject.recipient;
        transfer.denom = subject.nft->denom;
        transfer.id = subject.nft->id;
        return op;
    }

  public:
    OperationType
    getType() const override
    {
        return TRANSFER_NFT;
    }
};

class EditNFTMetadataOperation : public NFTOperation
{
  protected:
    std::optional<Subject>
    sample(nftsim_default_random_engine& engine,
           AbstractLedgerTxnParent const& ledger,
           SimAccounts const&) const override
    {
        auto nft = NFTSampler::randomOwnedNFT(ledger, engine);
        if (!nft)
        {
            return std::nullopt;
        }
        return Subject{nft->owner, nft->owner, nft};
    }

    Operation
    buildOperation(nftsim_default_random_engine& engine,
                   Subject const& subject) const override
    {
        Operation op;
        op.body.type(EDIT_NFT_METADATA);
        auto& edit = op.body.editNFTMetadataOp();
        edit.owner = subject.actor;
        edit.id = subject.nft->id;
        edit.denom = subject.nft->denom;
        edit.tokenURI = rand_alpha_string(TOKEN_URI_LENGTH, engine);
        return op;
    }

  public:
    OperationType
    getType() const override
    {
        return EDIT_NFT_METADATA;
    }
};

class MintNFTOperation : public NFTOperation
{
  protected:
    std::optional<Subject>
    sample(nftsim_default_random_engine& engine,
           AbstractLedgerTxnParent const&,
           SimAccounts const& accounts) const override
    {
        if (accounts.empty())
        {
            return std::nullopt;
        }
        // sender and recipient are drawn independently and may coincide
        auto const& sender = randomAccount(accounts, engine);
        auto const& recipient = randomAccount(accounts, engine);
        return Subject{sender.getAddress(), recipient.getAddress(),
                       std::nullopt};
    }

    Operation
    buildOperation(nftsim_default_random_engine& engine,
                   Subject const& subject) const override
    {
        Operation op;
        op.body.type(MINT_NFT);
        auto& mint = op.body.mintNFTOp();
        mint.sender = subject.actor;
        mint.recipient = subject.recipient;
        mint.id = rand_alpha_string(NFT_ID_LENGTH, engine);
        mint.denom = rand_alpha_string(NFT_DENOM_LENGTH, engine);
        mint.tokenURI = rand_alpha_string(TOKEN_URI_LENGTH, engine);
        return op;
    }

  public:
    OperationType
    getType() const override
    {
        return MINT_NFT;
    }
};

class BurnNFTOperation : public NFTOperation
{
  protected:
    std::optional<Subject>
    sample(nftsim_default_random_engine& engine,
           AbstractLedgerTxnParent const& ledger,
           SimAccounts const&) const override
    {
        auto nft = NFTSampler::randomOwnedNFT(ledger, engine);
        if (!nft)
        {
            return std::nullopt;
        }
        return Subject{nft->owner, nft->owner, nft};
    }

    Operation
    buildOperation(nftsim_default_random_engine&,
                   Subject const& subject) const override
    {
        Operation op;
        op.body.type(BURN_NFT);
        auto& burn = op.body.burnNFTOp();
        burn.owner = subject.actor;
        burn.id = subject.nft->id;
        burn.denom = subject.nft->denom;
        return op;
    }

  public:
    OperationType
    getType() const override
    {
        return BURN_NFT;
    }
};
}

OperationOutcome
NFTOperation::invoke(nftsim_default_random_engine& engine,
                     LedgerManager& ledger, SimAccounts const& accounts,
                     std::string const& chainID) const
{
    auto const type = getType();

    auto subject = sample(engine, ledger.getRoot(), accounts);
    if (!subject)
    {
        return OperationOutcome::noOp(type, "no eligible subject");
    }

    try
    {
        auto resolved =
            FeeResolver::resolve(ledger.getRoot(), accounts, subject->actor,
                                 engine);
        auto op = buildOperation(engine, *subject);
        auto envelope = TxSubmitter::buildAndSign(
            op, resolved.fee, chainID, resolved.entry.accountNumber,
            resolved.entry.seqNum, resolved.account.getSecretKey());
        return TxSubmitter::submit(ledger, op, envelope);
    }
    catch (OperationError const& e)
    {
        CLOG_DEBUG(Simulation, "{} not submitted: {}",
                   xdr::xdr_traits<OperationType>::enum_name(type), e.what());
        return OperationOutcome::failure(type, e.getCategory(), e.what());
    }
}

std::unique_ptr<NFTOperation>
makeNFTOperation(OperationType type)
{
    switch (type)
    {
    case MINT_NFT:
        return std::make_unique<MintNFTOperation>();
    case BURN_NFT:
        return std::make_unique<BurnNFTOperation>();
    case TRANSFER_NFT:
        return std::make_unique<TransferNFTOperation>();
    case EDIT_NFT_METADATA:
        return std::make_unique<EditNFTMetadataOperation>();
    }
    throw std::invalid_argument(fmt::format(
        FMT_STRING("unknown operation type {}"), static_cast<int32_t>(type)));
}
}
