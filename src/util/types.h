#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/NFT-types.h"
#include <string>
#include <vector>

namespace nftsim
{
typedef std::vector<unsigned char> Blob;

bool isZero(uint256 const& b);

// returns true if the passed string is valid
bool isStringValid(std::string const& str);

// returns true if the string contains something other than whitespace
bool isNonBlank(std::string const& str);

bool iequals(std::string const& a, std::string const& b);
}
