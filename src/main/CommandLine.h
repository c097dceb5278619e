#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "util/Logging.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace nftsim
{

struct CommandLineArgs
{
    std::string mExeName;
    std::string mCommandName;
    std::string mCommandDescription;
    std::vector<std::string> mArgs;
};

int handleCommandLine(int argc, char* const* argv);

void writeWithTextFlow(std::ostream& os, std::string const& text);

// Parses `arg` as a decimal integer in [0, max] into `value`. Returns an
// error message naming `name`, or an empty string on success.
std::string parseUnsigned(std::string const& arg, std::string const& name,
                          uint64_t max, uint64_t& value);
}
