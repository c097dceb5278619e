#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "main/CommandLine.h"
#include "main/Config.h"
#include "util/Logging.h"

namespace nftsim
{

struct CommandLineArgs;

// A small, fast configuration whose SEED follows the test run's --rng-seed.
Config const& getTestConfig();

// Seed for engines in tests that do not depend on particular draws.
uint64_t getTestSeed();

int runTest(CommandLineArgs const& args);
}
