// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "test/Catch2.h"
#include "test/test.h"
#include "util/Logging.h"

using namespace nftsim;

TEST_CASE("log level names", "[logging]")
{
    REQUIRE(Logging::getLLfromString("TRACE") == LogLevel::LVL_TRACE);
    REQUIRE(Logging::getLLfromString("warning") == LogLevel::LVL_WARNING);
    // anything unrecognized means info
    REQUIRE(Logging::getLLfromString("chatty") == LogLevel::LVL_INFO);
    REQUIRE(Logging::getStringFromLL(LogLevel::LVL_ERROR) == "Error");

    REQUIRE(Logging::normalizePartition("simulation") == "Simulation");
    REQUIRE_THROWS_AS(Logging::normalizePartition("Herder"),
                      std::invalid_argument);
}

TEST_CASE("partition log levels", "[logging]")
{
    auto global = Logging::getLogLevel("Ledger");

    Logging::setLogLevel(LogLevel::LVL_TRACE, "Tx");
    REQUIRE(Logging::getLogLevel("Tx") == LogLevel::LVL_TRACE);
    REQUIRE(Logging::getLogLevel("Ledger") == global);
    CLOG_TRACE(Tx, "trace enabled for {}", "Tx");

    // a global level resets the per-partition ones
    Logging::setLogLevel(global, nullptr);
    REQUIRE(Logging::getLogLevel("Tx") == global);
}
