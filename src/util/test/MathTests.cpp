// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "test/Catch2.h"
#include "test/test.h"
#include "util/Math.h"

#include <algorithm>
#include <cctype>
#include <set>

using namespace nftsim;

TEST_CASE("rand_uniform stays within bounds", "[math]")
{
    nftsim_default_random_engine engine(getTestSeed());
    for (int i = 0; i < 1000; ++i)
    {
        auto v = rand_uniform<int64_t>(-3, 3, engine);
        REQUIRE(v >= -3);
        REQUIRE(v <= 3);
    }
    REQUIRE(rand_uniform<uint32_t>(5, 5, engine) == 5);
}

TEST_CASE("rand_element", "[math]")
{
    nftsim_default_random_engine engine(getTestSeed());
    std::vector<int> empty;
    REQUIRE_THROWS_AS(rand_element(empty, engine), std::range_error);

    std::vector<int> v{1, 2, 3};
    std::set<int> seen;
    for (int i = 0; i < 200; ++i)
    {
        seen.insert(rand_element(v, engine));
    }
    REQUIRE(seen == std::set<int>{1, 2, 3});
}

TEST_CASE("rand_permutation is a permutation", "[math]")
{
    nftsim_default_random_engine engine(getTestSeed());
    REQUIRE(rand_permutation(0, engine).empty());

    auto perm = rand_permutation(50, engine);
    REQUIRE(perm.size() == 50);
    std::sort(perm.begin(), perm.end());
    for (size_t i = 0; i < perm.size(); ++i)
    {
        REQUIRE(perm[i] == i);
    }
}

TEST_CASE("rand_weighted_index", "[math]")
{
    nftsim_default_random_engine engine(getTestSeed());

    SECTION("zero weights are never picked")
    {
        std::vector<uint32_t> weights{0, 3, 0, 1};
        for (int i = 0; i < 500; ++i)
        {
            auto idx = rand_weighted_index(weights, engine);
            REQUIRE((idx == 1 || idx == 3));
        }
    }

    SECTION("all zero weights throw")
    {
        REQUIRE_THROWS_AS(rand_weighted_index({0, 0}, engine),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(rand_weighted_index({}, engine),
                          std::invalid_argument);
    }

    SECTION("picks roughly follow weights")
    {
        std::vector<uint32_t> weights{33, 5, 10, 5};
        std::vector<size_t> counts(weights.size(), 0);
        size_t const n = 53000;
        for (size_t i = 0; i < n; ++i)
        {
            ++counts[rand_weighted_index(weights, engine)];
        }
        REQUIRE(counts[0] > counts[2]);
        REQUIRE(counts[2] > counts[1]);
        REQUIRE(counts[2] > counts[3]);
    }
}

TEST_CASE("rand_alpha_string", "[math]")
{
    nftsim_default_random_engine engine(getTestSeed());
    auto s = rand_alpha_string(45, engine);
    REQUIRE(s.size() == 45);
    REQUIRE(std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    }));
    REQUIRE(rand_alpha_string(0, engine).empty());
}

TEST_CASE("same seed gives same draws", "[math]")
{
    nftsim_default_random_engine e1(1234);
    nftsim_default_random_engine e2(1234);
    REQUIRE(rand_alpha_string(10, e1) == rand_alpha_string(10, e2));
    REQUIRE(rand_permutation(10, e1) == rand_permutation(10, e2));
}

TEST_CASE("default engine is minstd", "[math]")
{
    // the 10000th draw of a default-constructed std::minstd_rand
    nftsim_default_random_engine engine;
    for (int i = 0; i < 9999; ++i)
    {
        engine();
    }
    REQUIRE(engine() == 399268537u);
}
