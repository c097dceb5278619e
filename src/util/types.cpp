// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "util/types.h"
#include <algorithm>
#include <cctype>

namespace nftsim
{

bool
isZero(uint256 const& b)
{
    for (auto i : b)
        if (i != 0)
            return false;

    return true;
}

bool
isStringValid(std::string const& str)
{
    for (auto c : str)
    {
        if (c < 0 || std::iscntrl(static_cast<unsigned char>(c)))
        {
            return false;
        }
    }
    return true;
}

bool
isNonBlank(std::string const& str)
{
    return std::any_of(str.begin(), str.end(), [](char c) {
        return !std::isspace(static_cast<unsigned char>(c));
    });
}

bool
iequals(std::string const& a, std::string const& b)
{
    size_t sz = a.size();
    if (b.size() != sz)
        return false;
    for (size_t i = 0; i < sz; ++i)
        if (tolower(a[i]) != tolower(b[i]))
            return false;
    return true;
}
}
