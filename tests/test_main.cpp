// Catch2WithMain provides main(); this file only holds the link smoke test

#include <catch2/catch_test_macros.hpp>
#include "matching/MatcherFactory.hpp"

TEST_CASE("Framework smoke test", "[smoke]")
{
    matching::MatchingConfig config;
    REQUIRE(matching::tryCreateCompositeMatcher(config) != nullptr);
}
