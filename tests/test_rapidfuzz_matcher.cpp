#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "processing/RapidFuzzMatcher.hpp"
#include "processing/PaymentTextNormalizer.hpp"

#include <memory>

using namespace processing;
using Catch::Matchers::WithinAbs;

TEST_CASE("RapidFuzzMatcher - exact matches after normalization", "[fuzzy]")
{
    RapidFuzzMatcher matcher;

    SECTION("Identical strings score 100 with all algorithms")
    {
        std::string text = "Fattura 2025/001 Rossi";
        REQUIRE_THAT(matcher.similarity(text, text, MatchAlgorithm::Ratio), WithinAbs(100.0, 0.001));
        REQUIRE_THAT(matcher.similarity(text, text, MatchAlgorithm::PartialRatio), WithinAbs(100.0, 0.001));
        REQUIRE_THAT(matcher.similarity(text, text, MatchAlgorithm::TokenSortRatio), WithinAbs(100.0, 0.001));
        REQUIRE_THAT(matcher.similarity(text, text, MatchAlgorithm::TokenSetRatio), WithinAbs(100.0, 0.001));
    }

    SECTION("Case, accents and punctuation are ignored")
    {
        REQUIRE_THAT(matcher.similarity("ROSSI MARIO S.R.L.", "Rossi Mario srl"), WithinAbs(100.0, 0.001));
        REQUIRE_THAT(matcher.similarity("MÜLLER GMBH", "muller gmbh"), WithinAbs(100.0, 0.001));
    }
}

TEST_CASE("RapidFuzzMatcher - algorithm differences", "[fuzzy]")
{
    RapidFuzzMatcher matcher;

    SECTION("Token sort ignores word order")
    {
        REQUIRE_THAT(matcher.similarity("mario rossi", "rossi mario", MatchAlgorithm::TokenSortRatio),
                     WithinAbs(100.0, 0.001));
        REQUIRE(matcher.similarity("mario rossi", "rossi mario", MatchAlgorithm::Ratio) < 100.0);
    }

    SECTION("Partial ratio finds a name inside longer text")
    {
        REQUIRE_THAT(matcher.similarity("rossi", "bonifico mario rossi", MatchAlgorithm::PartialRatio),
                     WithinAbs(100.0, 0.001));
    }

    SECTION("Token set tolerates extra words on both sides")
    {
        double score = matcher.similarity("BONIFICO MARIO ROSSI", "Mario Rossi invoice", MatchAlgorithm::TokenSetRatio);
        REQUIRE(score >= 75.0);
        REQUIRE(score < 85.0);
    }

    SECTION("Unrelated text scores low")
    {
        REQUIRE(matcher.similarity("affitto ufficio", "rossi mario", MatchAlgorithm::Ratio) < 50.0);
    }
}

TEST_CASE("RapidFuzzMatcher - findBestMatch", "[fuzzy]")
{
    RapidFuzzMatcher matcher;
    std::vector<std::string> candidates = {"Bianchi Luigi", "Rossi Mario", "Verdi Anna"};

    SECTION("Returns the best candidate index and score")
    {
        auto best = matcher.findBestMatch("ROSSI MARIO", candidates, 80.0);
        REQUIRE(best.has_value());
        REQUIRE(best->index == 1);
        REQUIRE_THAT(best->score, WithinAbs(100.0, 0.001));
        REQUIRE(best->algorithm == MatchAlgorithm::Ratio);
    }

    SECTION("Threshold filters weak matches")
    {
        REQUIRE_FALSE(matcher.findBestMatch("Neri Paolo", candidates, 90.0).has_value());
    }

    SECTION("Earliest candidate wins ties")
    {
        std::vector<std::string> duplicates = {"Rossi", "ROSSI", "rossi"};
        auto best = matcher.findBestMatch("rossi", duplicates, 0.0);
        REQUIRE(best.has_value());
        REQUIRE(best->index == 0);
    }

    SECTION("Empty inputs yield no match")
    {
        REQUIRE_FALSE(matcher.findBestMatch("", candidates, 0.0).has_value());
        REQUIRE_FALSE(matcher.findBestMatch("rossi", {}, 0.0).has_value());
        REQUIRE_FALSE(matcher.findBestMatch("...", candidates, 0.0).has_value());
    }
}

TEST_CASE("RapidFuzzMatcher - empty strings score zero", "[fuzzy]")
{
    RapidFuzzMatcher matcher(std::make_unique<PaymentTextNormalizer>());
    REQUIRE(matcher.similarity("", "rossi") == 0.0);
    REQUIRE(matcher.similarity("rossi", "") == 0.0);
    REQUIRE(matcher.similarity("!!!", "???") == 0.0);
}
