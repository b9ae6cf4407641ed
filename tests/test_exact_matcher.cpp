#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "matching/ExactAmountMatcher.hpp"
#include "utils/payment_fixtures.hpp"

using namespace matching;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using test_utils::addDays;
using test_utils::makeCandidate;
using test_utils::makeDate;
using test_utils::makeTransaction;

TEST_CASE("ExactAmountMatcher - same amount same day", "[matcher][exact]")
{
    ExactAmountMatcher matcher;
    const auto day = makeDate(2025, 1, 15);
    const auto tx = makeTransaction("1000.00", day, "BONIFICO");
    const std::vector<payment::PaymentCandidate> candidates = {makeCandidate(1, "1000.00", day)};

    auto results = matcher.match(tx, candidates);
    REQUIRE(results.size() == 1);
    REQUIRE_THAT(results[0].confidence(), WithinAbs(1.0, 1e-12));
    REQUIRE(results[0].type() == payment::MatchType::Exact);
    REQUIRE(results[0].hasField("amount"));
    REQUIRE(results[0].hasField("date"));
    REQUIRE_THAT(results[0].reason(), ContainsSubstring("Exact amount"));
    REQUIRE_THAT(results[0].reason(), ContainsSubstring("1000.00"));
    REQUIRE(results[0].amountDiff().isZero());
}

TEST_CASE("ExactAmountMatcher - tolerance and filtering", "[matcher][exact]")
{
    const auto day = makeDate(2025, 1, 15);
    const auto tx = makeTransaction("250.00", day);
    const std::vector<payment::PaymentCandidate> candidates = {
        makeCandidate(1, "250.01", addDays(day, 40)),
        makeCandidate(2, "250.02", day),
        makeCandidate(3, "250", addDays(day, 2)),
    };

    SECTION("Unrestricted window keeps input order")
    {
        ExactAmountMatcher matcher;
        auto results = matcher.match(tx, candidates);
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].candidateId() == 1);
        REQUIRE(results[1].candidateId() == 3);
        REQUIRE_FALSE(results[1].hasField("date"));
    }

    SECTION("Configured window drops distant due dates")
    {
        ExactAmountMatcher matcher(ExactMatcherConfig{7});
        auto results = matcher.match(tx, candidates);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].candidateId() == 3);
    }
}

TEST_CASE("ExactAmountMatcher - outstanding and negative amounts", "[matcher][exact]")
{
    ExactAmountMatcher matcher;
    const auto day = makeDate(2025, 1, 15);

    SECTION("Credit note matches refund")
    {
        const auto tx = makeTransaction("-500.00", day);
        const std::vector<payment::PaymentCandidate> candidates = {makeCandidate(9, "-500.00", day)};
        REQUIRE(matcher.match(tx, candidates).size() == 1);
    }

    SECTION("Partially paid candidate matches its remainder")
    {
        auto candidate = makeCandidate(4, "300.00", day);
        candidate.amount_paid = test_utils::money("100.00");
        const std::vector<payment::PaymentCandidate> candidates = {candidate};

        REQUIRE(matcher.match(makeTransaction("200.00", day), candidates).size() == 1);
        REQUIRE(matcher.match(makeTransaction("300.00", day), candidates).empty());
    }
}

TEST_CASE("ExactAmountMatcher - edge cases", "[matcher][exact]")
{
    ExactAmountMatcher matcher;
    const auto tx = makeTransaction("10.00", makeDate(2025, 1, 15));

    REQUIRE(matcher.match(tx, {}).empty());
    REQUIRE(matcher.name() == "exact");
    REQUIRE_THROWS_AS(ExactAmountMatcher(ExactMatcherConfig{-1}), ConfigurationError);
}
