// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SHA.h"
#include "ledger/LedgerManager.h"
#include "test/Catch2.h"
#include "test/TestUtils.h"
#include "test/TxTests.h"
#include "test/test.h"
#include "transactions/TransactionUtils.h"
#include "util/XDROperators.h"

#include <medida/counter.h>

using namespace nftsim;
using namespace nftsim::txtest;

/*
  Tests that are testing the common envelope used in transactions.
  Things like:
    authz/authn
    sequence numbers
    fees and vesting
*/

TEST_CASE("txenvelope", "[tx][envelope]")
{
    testutil::TestLedger ledger;
    auto& lm = ledger.getLedgerManager();
    auto a1 = ledger.createAccount("a1", {makeCoin("stake", 1000)});
    auto b1 = ledger.createAccount("b1", {makeCoin("stake", 1000)});
    ledger.createNFT("cat", "001", a1);

    auto transfer =
        transferNFT(a1.getAddress(), b1.getAddress(), "cat", "001");
    auto ae = ledger.loadAccount(a1);
    std::vector<Coin> fee{makeCoin("stake", 10)};

    auto requireUntouched = [&]() {
        auto after = ledger.loadAccount(a1);
        REQUIRE(after.seqNum == ae.seqNum);
        REQUIRE(getBalance(after.balances, "stake") == 1000);
        REQUIRE(ledger.loadNFT("cat", "001")->data.nft().owner ==
                a1.getAddress());
        REQUIRE(lm.getCurrentLedgerHeader().feePool.empty());
    };

    SECTION("success charges the fee and bumps the sequence number")
    {
        auto res = lm.applyTransaction(
            transactionFromOperations(lm, a1.getSecretKey(), {transfer}, fee));
        REQUIRE(res.ok);
        REQUIRE(res.result.feeCharged.size() == 1);
        REQUIRE(res.result.feeCharged[0] == makeCoin("stake", 10));

        auto after = ledger.loadAccount(a1);
        REQUIRE(after.seqNum == ae.seqNum + 1);
        REQUIRE(getBalance(after.balances, "stake") == 990);
        REQUIRE(getBalance(lm.getCurrentLedgerHeader().feePool, "stake") ==
                10);
        REQUIRE(ledger.getMetrics()
                    .NewCounter({"ledger", "apply", "success"})
                    .count() == 1);
    }

    SECTION("failed operation still charges the fee")
    {
        auto burnMissing = burnNFT(a1.getAddress(), "cat", "404");
        auto res = lm.applyTransaction(transactionFromOperations(
            lm, a1.getSecretKey(), {burnMissing}, fee));
        REQUIRE(!res.ok);
        REQUIRE(res.result.result.code() == txFAILED);
        REQUIRE(res.log ==
                "txFAILED: operation 0 (BURN_NFT) failed with "
                "BURN_NFT_NOT_FOUND: nft cat/404 not found");

        auto after = ledger.loadAccount(a1);
        REQUIRE(after.seqNum == ae.seqNum + 1);
        REQUIRE(getBalance(after.balances, "stake") == 990);
        REQUIRE(getBalance(lm.getCurrentLedgerHeader().feePool, "stake") ==
                10);
        REQUIRE(ledger.getMetrics()
                    .NewCounter({"ledger", "apply", "failure"})
                    .count() == 1);
    }

    SECTION("bad seq")
    {
        auto tx = transactionFromOperations(lm.getNetworkID(),
                                            a1.getSecretKey(), ae.accountNumber,
                                            ae.seqNum + 5, {transfer}, fee);
        auto res = lm.applyTransaction(tx);
        REQUIRE(res.result.result.code() == txBAD_SEQ);
        REQUIRE(res.log == "txBAD_SEQ: account sequence 0, transaction "
                           "sequence 5");
        requireUntouched();
    }

    SECTION("replaying a transaction fails with bad seq")
    {
        auto tx =
            transactionFromOperations(lm, a1.getSecretKey(), {transfer}, fee);
        REQUIRE(lm.applyTransaction(tx).ok);
        REQUIRE(lm.applyTransaction(tx).result.result.code() == txBAD_SEQ);
    }

    SECTION("bad account number")
    {
        auto tx = transactionFromOperations(
            lm.getNetworkID(), a1.getSecretKey(), ae.accountNumber + 1,
            ae.seqNum, {transfer}, fee);
        auto res = lm.applyTransaction(tx);
        REQUIRE(res.result.result.code() == txBAD_ACCOUNT_NUMBER);
        requireUntouched();
    }

    SECTION("bad auth")
    {
        SECTION("signed by another key")
        {
            auto tx = transactionFromOperations(lm, a1.getSecretKey(),
                                                {transfer}, fee);
            auto other = transactionFromOperations(lm, b1.getSecretKey(),
                                                   {transfer}, fee);
            tx.signatures = other.signatures;
            REQUIRE(lm.applyTransaction(tx).result.result.code() ==
                    txBAD_AUTH);
        }
        SECTION("signed for another network")
        {
            auto tx = transactionFromOperations(
                sha256(std::string("other-chain")), a1.getSecretKey(),
                ae.accountNumber, ae.seqNum, {transfer}, fee);
            REQUIRE(lm.applyTransaction(tx).result.result.code() ==
                    txBAD_AUTH);
        }
        SECTION("no signature")
        {
            auto tx = transactionFromOperations(lm, a1.getSecretKey(),
                                                {transfer}, fee);
            tx.signatures.clear();
            REQUIRE(lm.applyTransaction(tx).result.result.code() ==
                    txBAD_AUTH);
        }
        requireUntouched();
    }

    SECTION("no account")
    {
        auto ghost = getAccount("ghost");
        auto tx = transactionFromOperations(
            lm.getNetworkID(), ghost, 0, 0,
            {burnNFT(ghost.getPublicKey(), "cat", "001")}, fee);
        auto res = lm.applyTransaction(tx);
        REQUIRE(res.result.result.code() == txNO_ACCOUNT);
        requireUntouched();
    }

    SECTION("missing operation")
    {
        auto tx = transactionFromOperations(lm, a1.getSecretKey(), {}, fee);
        REQUIRE(lm.applyTransaction(tx).result.result.code() ==
                txMISSING_OPERATION);
        requireUntouched();
    }

    SECTION("malformed fee")
    {
        SECTION("duplicate denom")
        {
            auto tx = transactionFromOperations(
                lm, a1.getSecretKey(), {transfer},
                {makeCoin("stake", 1), makeCoin("stake", 1)});
            REQUIRE(lm.applyTransaction(tx).result.result.code() ==
                    txMALFORMED);
        }
        SECTION("negative amount")
        {
            auto tx = transactionFromOperations(lm, a1.getSecretKey(),
                                                {transfer},
                                                {makeCoin("stake", -1)});
            REQUIRE(lm.applyTransaction(tx).result.result.code() ==
                    txMALFORMED);
        }
        requireUntouched();
    }

    SECTION("insufficient balance")
    {
        SECTION("more than the balance")
        {
            auto tx = transactionFromOperations(lm, a1.getSecretKey(),
                                                {transfer},
                                                {makeCoin("stake", 1001)});
            REQUIRE(lm.applyTransaction(tx).result.result.code() ==
                    txINSUFFICIENT_BALANCE);
        }
        SECTION("denom not held")
        {
            auto tx = transactionFromOperations(lm, a1.getSecretKey(),
                                                {transfer},
                                                {makeCoin("atom", 1)});
            REQUIRE(lm.applyTransaction(tx).result.result.code() ==
                    txINSUFFICIENT_BALANCE);
        }
        requireUntouched();
    }

    SECTION("whole balance can be spent on fees")
    {
        auto tx = transactionFromOperations(lm, a1.getSecretKey(), {transfer},
                                            {makeCoin("stake", 1000)});
        REQUIRE(lm.applyTransaction(tx).ok);
        REQUIRE(ledger.loadAccount(a1).balances.empty());
    }
}

TEST_CASE("txenvelope vesting", "[tx][envelope][vesting]")
{
    testutil::TestLedger ledger;
    auto& lm = ledger.getLedgerManager();

    VestingSchedule vesting;
    vesting.locked.emplace_back(makeCoin("stake", 800));
    vesting.endTime = testutil::TEST_GENESIS_CLOSE_TIME + 100;
    auto v1 = ledger.createAccount("v1", {makeCoin("stake", 1000)}, &vesting);
    ledger.createNFT("cat", "001", v1);

    auto edit = editNFTMetadata(v1.getAddress(), "cat", "001", "ipfs://v");
    auto ae = ledger.loadAccount(v1);
    REQUIRE(getSpendableBalance(ae, "stake", lm.getCurrentLedgerHeader()
                                                 .closeTime) == 200);

    SECTION("locked coins cannot pay fees")
    {
        auto tx = transactionFromOperations(lm, v1.getSecretKey(), {edit},
                                            {makeCoin("stake", 201)});
        REQUIRE(lm.applyTransaction(tx).result.result.code() ==
                txINSUFFICIENT_BALANCE);
        REQUIRE(lm.applyTransaction(
                      transactionFromOperations(lm, v1.getSecretKey(), {edit},
                                                {makeCoin("stake", 200)}))
                    .ok);
    }

    SECTION("coins unlock at the end time")
    {
        lm.closeLedger(vesting.endTime);
        auto tx = transactionFromOperations(lm, v1.getSecretKey(), {edit},
                                            {makeCoin("stake", 1000)});
        REQUIRE(lm.applyTransaction(tx).ok);
    }
}

TEST_CASE("ledger close", "[ledger]")
{
    testutil::TestLedger ledger;
    auto& lm = ledger.getLedgerManager();
    auto const& header = lm.getCurrentLedgerHeader();
    REQUIRE(header.ledgerSeq == LedgerManager::GENESIS_LEDGER_SEQ);
    REQUIRE(header.closeTime == testutil::TEST_GENESIS_CLOSE_TIME);

    lm.closeLedger(testutil::TEST_GENESIS_CLOSE_TIME + 5);
    REQUIRE(lm.getCurrentLedgerHeader().ledgerSeq ==
            LedgerManager::GENESIS_LEDGER_SEQ + 1);
    REQUIRE(lm.getCurrentLedgerHeader().closeTime ==
            testutil::TEST_GENESIS_CLOSE_TIME + 5);

    REQUIRE_THROWS_AS(lm.closeLedger(testutil::TEST_GENESIS_CLOSE_TIME),
                      std::invalid_argument);
    REQUIRE(lm.getNetworkID() == sha256(std::string("nftsim-test-chain")));
}
