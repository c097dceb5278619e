// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SHA.h"
#include "ledger/NFTOwners.h"
#include "simulation/NFTOperation.h"
#include "simulation/TxSubmitter.h"
#include "test/Catch2.h"
#include "test/TestUtils.h"
#include "test/TxTests.h"
#include "test/test.h"
#include "transactions/TransactionUtils.h"
#include "util/XDROperators.h"

#include <medida/counter.h>

#include <algorithm>
#include <cctype>

using namespace nftsim;
using namespace nftsim::txtest;

namespace
{
std::string const CHAIN_ID = "nftsim-test-chain";

uint64_t
appliedTransactions(testutil::TestLedger& ledger)
{
    auto& m = ledger.getMetrics();
    return m.NewCounter({"ledger", "apply", "success"}).count() +
           m.NewCounter({"ledger", "apply", "failure"}).count();
}

bool
isAlpha(std::string const& s)
{
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    });
}
}

TEST_CASE("transfer operation", "[simulation][transfer]")
{
    // the recipient is random, so try seeds until one picks B
    bool sawOtherRecipient = false;
    nftsim_default_random_engine seeds(getTestSeed());
    for (int i = 0; i < 64; ++i)
    {
        auto seed = seeds();
        testutil::TestLedger ledger;
        auto a = ledger.createAccount("A", {makeCoin("stake", 1000)});
        auto b = ledger.createAccount("B", {makeCoin("stake", 1000)});
        ledger.createNFT("collectible", "001", a);

        nftsim_default_random_engine engine(seed);
        auto outcome = makeNFTOperation(TRANSFER_NFT)
                           ->invoke(engine, ledger.getLedgerManager(),
                                    ledger.getAccounts(), CHAIN_ID);
        REQUIRE(outcome.isSuccess());
        REQUIRE(outcome.type == TRANSFER_NFT);
        REQUIRE(outcome.request);

        auto const& req = outcome.request->body.transferNFTOp();
        REQUIRE(req.sender == a.getAddress());
        REQUIRE(req.denom == "collectible");
        REQUIRE(req.id == "001");

        auto nft = ledger.loadNFT("collectible", "001");
        REQUIRE(nft->data.nft().owner == req.recipient);

        // A paid a fee and consumed a sequence number
        auto ae = ledger.loadAccount(a);
        REQUIRE(ae.seqNum == 1);
        REQUIRE(getBalance(ae.balances, "stake") < 1000);
        REQUIRE(getBalance(ae.balances, "stake") >= 0);

        if (req.recipient == b.getAddress())
        {
            REQUIRE(getOwners(ledger.getLedgerManager().getRoot())
                        .at(0)
                        .address == b.getAddress());
            sawOtherRecipient = true;
            break;
        }
    }
    REQUIRE(sawOtherRecipient);
}

TEST_CASE("operations without a subject are noops", "[simulation]")
{
    testutil::TestLedger ledger;
    ledger.createAccount("A", {makeCoin("stake", 1000)});
    nftsim_default_random_engine engine(getTestSeed());

    for (auto type : {BURN_NFT, TRANSFER_NFT, EDIT_NFT_METADATA})
    {
        auto outcome = makeNFTOperation(type)->invoke(
            engine, ledger.getLedgerManager(), ledger.getAccounts(), CHAIN_ID);
        REQUIRE(outcome.isNoOp());
        REQUIRE(outcome.type == type);
        REQUIRE(outcome.reason == "no eligible subject");
        REQUIRE(!outcome.request);
    }
    REQUIRE(appliedTransactions(ledger) == 0);

    SECTION("mint needs an account")
    {
        auto outcome = makeNFTOperation(MINT_NFT)->invoke(
            engine, ledger.getLedgerManager(), {}, CHAIN_ID);
        REQUIRE(outcome.isNoOp());
        REQUIRE(outcome.toString() == "MINT_NFT noop: no eligible subject");
    }
}

TEST_CASE("mint operation", "[simulation][mint]")
{
    testutil::TestLedger ledger;
    nftsim_default_random_engine engine(getTestSeed());

    SECTION("sender without coins fails before submission")
    {
        ledger.createAccount("poor", {});
        auto outcome = makeNFTOperation(MINT_NFT)->invoke(
            engine, ledger.getLedgerManager(), ledger.getAccounts(), CHAIN_ID);
        REQUIRE(outcome.isFailure());
        REQUIRE(outcome.category == FailureCategory::FEE_COMPUTATION);
        REQUIRE(outcome.reason == "no coins found for random fees");
        REQUIRE(!outcome.request);
        REQUIRE(outcome.toString() == "MINT_NFT failure (fee-computation): no "
                                      "coins found for random fees");
        REQUIRE(appliedTransactions(ledger) == 0);
        REQUIRE(countNFTs(ledger.getLedgerManager().getRoot()) == 0);
    }

    SECTION("sender with fully vested coins fails before submission")
    {
        VestingSchedule vesting;
        vesting.locked.emplace_back(makeCoin("stake", 500));
        vesting.endTime = testutil::TEST_GENESIS_CLOSE_TIME + 10;
        ledger.createAccount("locked", {makeCoin("stake", 500)}, &vesting);
        auto outcome = makeNFTOperation(MINT_NFT)->invoke(
            engine, ledger.getLedgerManager(), ledger.getAccounts(), CHAIN_ID);
        REQUIRE(outcome.isFailure());
        REQUIRE(outcome.category == FailureCategory::FEE_COMPUTATION);
        REQUIRE(appliedTransactions(ledger) == 0);
    }

    SECTION("success")
    {
        ledger.createAccount("A", {makeCoin("stake", 1000)});
        ledger.createAccount("B", {makeCoin("stake", 1000)});
        auto outcome = makeNFTOperation(MINT_NFT)->invoke(
            engine, ledger.getLedgerManager(), ledger.getAccounts(), CHAIN_ID);
        REQUIRE(outcome.isSuccess());

        auto const& req = outcome.request->body.mintNFTOp();
        REQUIRE(req.id.size() == 10);
        REQUIRE(req.denom.size() == 10);
        REQUIRE(req.tokenURI.size() == 45);
        REQUIRE(isAlpha(req.id));
        REQUIRE(isAlpha(req.denom));
        REQUIRE(isAlpha(req.tokenURI));

        auto nft = ledger.loadNFT(req.denom, req.id);
        REQUIRE(nft);
        REQUIRE(nft->data.nft().owner == req.recipient);
        REQUIRE(nft->data.nft().tokenURI == req.tokenURI);
        REQUIRE(countNFTs(ledger.getLedgerManager().getRoot()) == 1);
    }
}

TEST_CASE("burn operation", "[simulation][burn]")
{
    testutil::TestLedger ledger;
    auto a = ledger.createAccount("A", {makeCoin("stake", 1000)});
    ledger.createNFT("cat", "001", a);
    nftsim_default_random_engine engine(getTestSeed());

    auto outcome = makeNFTOperation(BURN_NFT)->invoke(
        engine, ledger.getLedgerManager(), ledger.getAccounts(), CHAIN_ID);
    REQUIRE(outcome.isSuccess());
    REQUIRE(outcome.request->body.burnNFTOp().owner == a.getAddress());
    REQUIRE(!ledger.loadNFT("cat", "001"));

    // nothing left to burn
    outcome = makeNFTOperation(BURN_NFT)->invoke(
        engine, ledger.getLedgerManager(), ledger.getAccounts(), CHAIN_ID);
    REQUIRE(outcome.isNoOp());
}

TEST_CASE("edit metadata operation", "[simulation][edit]")
{
    testutil::TestLedger ledger;
    auto a = ledger.createAccount("A", {makeCoin("stake", 1000)});
    ledger.createNFT("cat", "001", a, "ipfs://old");
    nftsim_default_random_engine engine(getTestSeed());

    auto outcome = makeNFTOperation(EDIT_NFT_METADATA)
                       ->invoke(engine, ledger.getLedgerManager(),
                                ledger.getAccounts(), CHAIN_ID);
    REQUIRE(outcome.isSuccess());

    auto const& req = outcome.request->body.editNFTMetadataOp();
    REQUIRE(req.tokenURI.size() == 45);
    auto nft = ledger.loadNFT("cat", "001");
    REQUIRE(nft->data.nft().tokenURI == req.tokenURI);
    REQUIRE(nft->data.nft().owner == a.getAddress());
}

TEST_CASE("owner without a signing key", "[simulation]")
{
    testutil::TestLedger ledger;
    ledger.createAccount("A", {makeCoin("stake", 1000)});

    // an account on the ledger whose key the simulation does not hold
    auto stranger = getAccount("stranger");
    ledger.getLedgerManager().createAccount(stranger.getPublicKey(),
                                            {makeCoin("stake", 1000)},
                                            nullptr);
    ledger.getLedgerManager().createNFT("cat", "001", stranger.getPublicKey(),
                                        "ipfs://x");

    nftsim_default_random_engine engine(getTestSeed());
    auto outcome = makeNFTOperation(BURN_NFT)->invoke(
        engine, ledger.getLedgerManager(), ledger.getAccounts(), CHAIN_ID);
    REQUIRE(outcome.isFailure());
    REQUIRE(outcome.category == FailureCategory::ACCOUNT_RESOLUTION);
    REQUIRE(outcome.reason ==
            "account " + KeyUtils::toHexString(stranger.getPublicKey()) +
                " not found");
    REQUIRE(ledger.loadNFT("cat", "001"));
    REQUIRE(appliedTransactions(ledger) == 0);
}

TEST_CASE("submitter reports ledger rejections", "[simulation]")
{
    testutil::TestLedger ledger;
    auto a = ledger.createAccount("A", {makeCoin("stake", 1000)});
    auto ae = ledger.loadAccount(a);

    auto op = burnNFT(a.getAddress(), "cat", "404");
    auto envelope = TxSubmitter::buildAndSign(
        op, {makeCoin("stake", 3)}, CHAIN_ID, ae.accountNumber, ae.seqNum,
        a.getSecretKey());
    REQUIRE(envelope.tx.fee.gas == TxSubmitter::GAS_LIMIT);
    REQUIRE(envelope.tx.memo.empty());
    REQUIRE(envelope.signatures.size() == 1);

    SECTION("applied transaction")
    {
        ledger.createNFT("cat", "404", a);
        auto outcome =
            TxSubmitter::submit(ledger.getLedgerManager(), op, envelope);
        REQUIRE(outcome.isSuccess());
        REQUIRE(outcome.reason.empty());
        REQUIRE(*outcome.request == op);
        REQUIRE(!ledger.loadNFT("cat", "404"));
    }

    SECTION("failed operation")
    {
        auto outcome =
            TxSubmitter::submit(ledger.getLedgerManager(), op, envelope);
        REQUIRE(outcome.isFailure());
        REQUIRE(outcome.category == FailureCategory::EXECUTION_REJECTED);
        REQUIRE(outcome.request);
        REQUIRE(outcome.reason == "txFAILED: operation 0 (BURN_NFT) failed "
                                  "with BURN_NFT_NOT_FOUND: nft cat/404 not "
                                  "found");
    }

    SECTION("wrong chain")
    {
        auto other = TxSubmitter::buildAndSign(
            op, {makeCoin("stake", 3)}, "other-chain", ae.accountNumber,
            ae.seqNum, a.getSecretKey());
        auto outcome =
            TxSubmitter::submit(ledger.getLedgerManager(), op, other);
        REQUIRE(outcome.isFailure());
        REQUIRE(outcome.reason.rfind("txBAD_AUTH", 0) == 0);
    }
}

TEST_CASE("same seed builds the same requests", "[simulation][determinism]")
{
    auto populate = [](testutil::TestLedger& ledger) {
        auto a = ledger.createAccount(
            "A", {makeCoin("stake", 1000), makeCoin("atom", 50)});
        auto b = ledger.createAccount("B", {makeCoin("stake", 700)});
        ledger.createAccount("C", {makeCoin("atom", 300)});
        ledger.createNFT("doge", "001", a);
        ledger.createNFT("doge", "002", a);
        ledger.createNFT("cat", "001", b);
    };

    for (auto type : {MINT_NFT, TRANSFER_NFT, EDIT_NFT_METADATA, BURN_NFT})
    {
        INFO(xdr::xdr_traits<OperationType>::enum_name(type));

        testutil::TestLedger ledger1;
        testutil::TestLedger ledger2;
        populate(ledger1);
        populate(ledger2);

        nftsim_default_random_engine engine1(getTestSeed());
        nftsim_default_random_engine engine2(getTestSeed());
        auto o1 = makeNFTOperation(type)->invoke(
            engine1, ledger1.getLedgerManager(), ledger1.getAccounts(),
            CHAIN_ID);
        auto o2 = makeNFTOperation(type)->invoke(
            engine2, ledger2.getLedgerManager(), ledger2.getAccounts(),
            CHAIN_ID);

        REQUIRE(o1.isSuccess());
        REQUIRE(o2.isSuccess());
        REQUIRE(o1.request);
        REQUIRE(o2.request);
        REQUIRE(*o1.request == *o2.request);
        REQUIRE(engine1() == engine2());

        if (type == MINT_NFT)
        {
            auto const& mint = o1.request->body.mintNFTOp();
            REQUIRE(mint.denom.size() == 10);
            REQUIRE(mint.id.size() == 10);
            REQUIRE(mint.tokenURI.size() == 45);
        }

        // both ledgers charged the same fee
        auto const& accounts1 = ledger1.getAccounts();
        auto const& accounts2 = ledger2.getAccounts();
        for (size_t i = 0; i < accounts1.size(); ++i)
        {
            REQUIRE(ledger1.loadAccount(accounts1[i]) ==
                    ledger2.loadAccount(accounts2[i]));
        }
    }
}
