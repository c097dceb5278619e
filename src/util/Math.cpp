// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "util/Math.h"
#include <numeric>

namespace nftsim
{

bool
rand_flip(nftsim_default_random_engine& engine)
{
    return (engine() & 1);
}

std::vector<size_t>
rand_permutation(size_t n, nftsim_default_random_engine& engine)
{
    std::vector<size_t> perm(n);
    std::iota(perm.begin(), perm.end(), 0);
    // Fisher-Yates with our own draws; std::shuffle's draw pattern is
    // implementation-defined.
    for (size_t i = n; i > 1; --i)
    {
        auto j = rand_uniform<size_t>(0, i - 1, engine);
        std::swap(perm[i - 1], perm[j]);
    }
    return perm;
}

size_t
rand_weighted_index(std::vector<uint32_t> const& weights,
                    nftsim_default_random_engine& engine)
{
    uint64_t total =
        std::accumulate(weights.begin(), weights.end(), uint64_t(0));
    if (total == 0)
    {
        throw std::invalid_argument("rand_weighted_index: all weights are 0");
    }
    auto pick = rand_uniform<uint64_t>(0, total - 1, engine);
    for (size_t i = 0; i < weights.size(); ++i)
    {
        if (pick < weights[i])
        {
            return i;
        }
        pick -= weights[i];
    }
    throw std::logic_error("rand_weighted_index: unreachable");
}

std::string
rand_alpha_string(size_t n, nftsim_default_random_engine& engine)
{
    static char const letters[] =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    std::string res;
    res.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        res.push_back(letters[rand_uniform<size_t>(0, 51, engine)]);
    }
    return res;
}
}
