#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace nftsim
{

// There is deliberately no process-wide engine: every caller that needs
// randomness is handed the engine of the run it belongs to, so a whole run is
// replayable from its seed.
typedef std::minstd_rand nftsim_default_random_engine;

template <typename T>
T
rand_uniform(T lo, T hi, nftsim_default_random_engine& engine)
{
    return std::uniform_int_distribution<T>(lo, hi)(engine);
}

bool rand_flip(nftsim_default_random_engine& engine);

template <typename T>
T const&
rand_element(std::vector<T> const& v, nftsim_default_random_engine& engine)
{
    if (v.size() == 0)
    {
        throw std::range_error("rand_element on empty vector");
    }
    return v.at(rand_uniform<size_t>(0, v.size() - 1, engine));
}

// Returns a permutation of [0, n) drawn from `engine`.
std::vector<size_t> rand_permutation(size_t n,
                                     nftsim_default_random_engine& engine);

// Picks an index with probability proportional to its weight. Throws if all
// weights are zero.
size_t rand_weighted_index(std::vector<uint32_t> const& weights,
                           nftsim_default_random_engine& engine);

// Returns `n` characters drawn uniformly from [a-zA-Z].
std::string rand_alpha_string(size_t n, nftsim_default_random_engine& engine);
}
