#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "payment/MatchResult.hpp"
#include "utils/payment_fixtures.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace payment;
using Catch::Matchers::WithinAbs;
using test_utils::makeCandidate;
using test_utils::makeDate;
using test_utils::makeTransaction;

TEST_CASE("Confidence - bounds are enforced at construction", "[match_result][confidence]")
{
    REQUIRE_NOTHROW(Confidence(0.0));
    REQUIRE_NOTHROW(Confidence(1.0));
    REQUIRE_THAT(Confidence(0.42).value(), WithinAbs(0.42, 1e-12));

    REQUIRE_THROWS_AS(Confidence(-0.0001), std::out_of_range);
    REQUIRE_THROWS_AS(Confidence(1.0001), std::out_of_range);
    REQUIRE_THROWS_AS(Confidence(std::nan("")), std::out_of_range);
    REQUIRE_THROWS_AS(Confidence(std::numeric_limits<double>::infinity()), std::out_of_range);

    REQUIRE(Confidence::isValid(0.5));
    REQUIRE_FALSE(Confidence::isValid(2.0));
}

TEST_CASE("MatchResult - fields and back references", "[match_result]")
{
    auto tx = makeTransaction("100.00", makeDate(2025, 1, 15), "BONIFICO");
    auto candidate = makeCandidate(7, "99.50", makeDate(2025, 1, 16));

    MatchResult result(tx, candidate, Confidence(0.8), MatchType::DateWindow, "reason", {"amount", "date"});

    REQUIRE(&result.transaction() == &tx);
    REQUIRE(&result.candidate() == &candidate);
    REQUIRE(result.candidateId() == 7);
    REQUIRE(result.type() == MatchType::DateWindow);
    REQUIRE(result.reason() == "reason");
    REQUIRE(result.hasField("amount"));
    REQUIRE(result.hasField("date"));
    REQUIRE_FALSE(result.hasField("iban"));
    REQUIRE(result.amountDiff() == test_utils::money("0.50"));
    REQUIRE(result.strategy().empty());

    SECTION("setConfidence rejects out-of-range values and keeps the old value")
    {
        REQUIRE_THROWS_AS(result.setConfidence(1.5), std::out_of_range);
        REQUIRE_THAT(result.confidence(), WithinAbs(0.8, 1e-12));

        result.setConfidence(0.3);
        REQUIRE_THAT(result.confidence(), WithinAbs(0.3, 1e-12));
    }

    SECTION("Mutable annotations")
    {
        result.setType(MatchType::Composite);
        result.setReason("merged");
        result.setStrategy("composite");
        REQUIRE(result.type() == MatchType::Composite);
        REQUIRE(result.reason() == "merged");
        REQUIRE(result.strategy() == "composite");
    }
}

TEST_CASE("MatchType - string forms", "[match_result]")
{
    REQUIRE(toString(MatchType::Exact) == "exact");
    REQUIRE(toString(MatchType::Fuzzy) == "fuzzy");
    REQUIRE(toString(MatchType::Iban) == "iban");
    REQUIRE(toString(MatchType::DateWindow) == "date-window");
    REQUIRE(toString(MatchType::Composite) == "composite");
}
