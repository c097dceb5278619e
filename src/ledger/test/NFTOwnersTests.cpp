// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "ledger/NFTOwners.h"
#include "test/Catch2.h"
#include "test/TestUtils.h"
#include "test/TxTests.h"
#include "test/test.h"
#include "util/XDROperators.h"

using namespace nftsim;

TEST_CASE("getOwners groups nfts by owner and denom", "[nftowners]")
{
    testutil::TestLedger ledger;
    auto alice = ledger.createAccount("alice", {});
    auto bob = ledger.createAccount("bob", {});

    SECTION("empty ledger")
    {
        REQUIRE(getOwners(ledger.getLedgerManager().getRoot()).empty());
        REQUIRE(countNFTs(ledger.getLedgerManager().getRoot()) == 0);
    }

    SECTION("accounts without nfts are not listed")
    {
        ledger.createNFT("cat", "002", alice);
        ledger.createNFT("doge", "001", alice);
        ledger.createNFT("cat", "001", alice);

        auto owners = getOwners(ledger.getLedgerManager().getRoot());
        REQUIRE(owners.size() == 1);
        REQUIRE(owners[0].address == alice.getAddress());

        auto const& colls = owners[0].idCollections;
        REQUIRE(colls.size() == 2);
        REQUIRE(colls[0].denom == "cat");
        REQUIRE(colls[0].ids == std::vector<std::string>{"001", "002"});
        REQUIRE(colls[1].denom == "doge");
        REQUIRE(colls[1].ids == std::vector<std::string>{"001"});
        REQUIRE(countNFTs(ledger.getLedgerManager().getRoot()) == 3);
    }

    SECTION("owners are ordered by address")
    {
        ledger.createNFT("cat", "001", alice);
        ledger.createNFT("cat", "002", bob);

        auto owners = getOwners(ledger.getLedgerManager().getRoot());
        REQUIRE(owners.size() == 2);
        REQUIRE(KeyUtils::toHexString(owners[0].address) <
                KeyUtils::toHexString(owners[1].address));
        for (auto const& owner : owners)
        {
            REQUIRE(owner.idCollections.size() == 1);
            REQUIRE(owner.idCollections[0].ids.size() == 1);
        }
    }
}
