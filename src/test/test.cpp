// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#define CATCH_CONFIG_RUNNER

#include "test/test.h"
#include "main/Config.h"
#include "main/NFTSimVersion.h"
#include "test/Catch2.h"
#include "util/Logging.h"

#include <ctime>
#include <fmt/format.h>
#include <memory>
#include <sodium.h>

namespace nftsim
{

// --rng-seed of the current run; engines created by tests follow it.
static unsigned int gCommandLineSeed = 0;

static std::unique_ptr<Config> gTestCfg;

uint64_t
getTestSeed()
{
    // 0 would mean "pick a seed" to the simulation
    return static_cast<uint64_t>(gCommandLineSeed) + 1;
}

Config const&
getTestConfig()
{
    if (!gTestCfg)
    {
        gTestCfg = std::make_unique<Config>();
        auto& cfg = *gTestCfg;
        cfg.CHAIN_ID = "nftsim-test-chain";
        cfg.SEED = getTestSeed();
        cfg.NUM_ACCOUNTS = 5;
        cfg.NUM_LEDGERS = 10;
        cfg.MAX_OPERATIONS_PER_LEDGER = 10;
        cfg.MIN_INITIAL_BALANCE = 1000;
        cfg.MAX_INITIAL_BALANCE = 100000;
        cfg.ZERO_BALANCE_PERCENT = 0;
        cfg.VESTING_PERCENT = 0;
    }
    return *gTestCfg;
}

int
runTest(CommandLineArgs const& args)
{
    LogLevel logLevel{LogLevel::LVL_INFO};

    Catch::Session session{};

    auto& seed = session.configData().rngSeed;

    // rotate the seed every 24 hours
    seed = static_cast<unsigned int>(std::time(nullptr)) / (24 * 3600);

    auto parser = session.cli();
    parser |= Catch::clara::Opt(
        [&](std::string const& arg) {
            logLevel = Logging::getLLfromString(arg);
        },
        "LEVEL")["--ll"]("set the log level");

    session.cli(parser);

    auto result = session.cli().parse(
        args.mCommandName, Catch::clara::detail::TokenStream{
                               std::begin(args.mArgs), std::end(args.mArgs)});
    if (!result)
    {
        writeWithTextFlow(std::cerr, result.errorMessage());
        writeWithTextFlow(std::cerr, args.mCommandDescription);
        session.cli().writeToStream(std::cerr);
        return 1;
    }

    if (session.configData().showHelp)
    {
        writeWithTextFlow(std::cout, args.mCommandDescription);
        session.cli().writeToStream(std::cout);
        return 0;
    }

    if (session.configData().libIdentify)
    {
        session.libIdentify();
        return 0;
    }

    gCommandLineSeed = seed;
    gTestCfg.reset();

    if (sodium_init() < 0)
    {
        LOG_FATAL(DEFAULT_LOG, "Could not initialize crypto");
        return 1;
    }

    Logging::setFmt("<test>");
    Logging::setLogLevel(logLevel, nullptr);
    auto logFile = std::string("nftsim-test.log");
    Logging::setLoggingToFile(logFile);
    Logging::setLogLevel(logLevel, nullptr);

    LOG_INFO(DEFAULT_LOG, "Testing nftsim {}", NFTSIM_VERSION);
    LOG_INFO(DEFAULT_LOG, "Logging to {}", logFile);

    auto r = session.run();
    // In the 'list' modes Catch returns the number of tests listed. We don't
    // want to treat this value as and error code.
    if (session.configData().listTests ||
        session.configData().listTestNamesOnly ||
        session.configData().listTags || session.configData().listReporters)
    {
        r = 0;
    }
    gTestCfg.reset();

    if (r != 0)
    {
        LOG_ERROR(DEFAULT_LOG, "Nonzero test result with --rng-seed {}", seed);
    }
    return r;
}
}
