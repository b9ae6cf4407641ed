#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "payment/Amount.hpp"
#include "payment/PaymentTypes.hpp"
#include "utils/payment_fixtures.hpp"

using payment::Amount;
using Catch::Matchers::WithinAbs;
using test_utils::money;

TEST_CASE("Amount - parsing", "[amount]")
{
    SECTION("Trailing zeros do not change the value")
    {
        REQUIRE(money("100") == money("100.0"));
        REQUIRE(money("100.0") == money("100.00"));
        REQUIRE(money("100.00") == money("100.000"));
    }

    SECTION("Sign and surrounding whitespace")
    {
        REQUIRE(money("  -1234.56 ").units() == -12345600);
        REQUIRE(money("+5").units() == 50000);
        REQUIRE(money(".5").units() == 5000);
    }

    SECTION("Malformed text is rejected")
    {
        REQUIRE_FALSE(Amount::parse(""));
        REQUIRE_FALSE(Amount::parse("   "));
        REQUIRE_FALSE(Amount::parse("-"));
        REQUIRE_FALSE(Amount::parse("."));
        REQUIRE_FALSE(Amount::parse("12a"));
        REQUIRE_FALSE(Amount::parse("1..2"));
        REQUIRE_FALSE(Amount::parse("1.2.3"));
        REQUIRE_FALSE(Amount::parse("1,50"));
    }

    SECTION("More than four fractional digits is rejected")
    {
        REQUIRE(Amount::parse("0.0001"));
        REQUIRE_FALSE(Amount::parse("0.00001"));
    }

    SECTION("Values outside the representable range are rejected")
    {
        REQUIRE_FALSE(Amount::parse("922337203685479"));
        REQUIRE_FALSE(Amount::parse("922337203685477.5808"));
        REQUIRE_FALSE(Amount::parse("-922337203685478"));
        REQUIRE_FALSE(Amount::parse("99999999999999999999999"));
        REQUIRE(money("922337203685477.5807").units() == 9223372036854775807LL);
        REQUIRE(money("-922337203685477.5807").units() == -9223372036854775807LL);
    }
}

TEST_CASE("Amount - formatting", "[amount]")
{
    REQUIRE(money("1234.56").toString() == "1234.56");
    REQUIRE(money("-1234.56").toString() == "-1234.56");
    REQUIRE(money("7").toString() == "7.00");
    REQUIRE(money("0.05").toString() == "0.05");

    SECTION("Rounds half away from zero")
    {
        REQUIRE(money("1.2345").toString() == "1.23");
        REQUIRE(money("1.235").toString() == "1.24");
        REQUIRE(money("-1.235").toString() == "-1.24");
    }

    SECTION("Negative values that round to zero print without sign")
    {
        REQUIRE(money("-0.001").toString() == "0.00");
    }
}

TEST_CASE("Amount - arithmetic and comparison", "[amount]")
{
    REQUIRE(money("10.10") + money("0.90") == money("11"));
    REQUIRE(money("10") - money("10.01") == money("-0.01"));
    REQUIRE(-money("3.5") == money("-3.5"));
    REQUIRE(money("-3.5").abs() == money("3.5"));
    REQUIRE(money("0.01") == Amount::oneCent());
    REQUIRE(Amount::fromCents(150) == money("1.50"));
    REQUIRE(money("99.99") < money("100"));
    REQUIRE(Amount{}.isZero());
    REQUIRE(money("-0.0001").isNegative());
    REQUIRE(payment::absoluteDifference(money("100"), money("99.5")) == money("0.5"));
}

TEST_CASE("Amount - percentage of a base", "[amount]")
{
    SECTION("Boundaries are inclusive and exact")
    {
        REQUIRE(money("7").isWithinPercentOf(money("100"), 7.0));
        REQUIRE(money("14").isWithinPercentOf(money("100"), 14.0));
        REQUIRE(money("10").isWithinPercentOf(money("1000"), 1.0));
        REQUIRE(money("50").isWithinPercentOf(money("1000"), 5.0));
        REQUIRE(money("100").isWithinPercentOf(money("1000"), 10.0));
        REQUIRE(money("0.29").isWithinPercentOf(money("1"), 29.0));
        REQUIRE_FALSE(money("7.0001").isWithinPercentOf(money("100"), 7.0));
        REQUIRE_FALSE(money("100.01").isWithinPercentOf(money("1000"), 10.0));
    }

    SECTION("Signs are ignored")
    {
        REQUIRE(money("-5").isWithinPercentOf(money("200"), 2.5));
        REQUIRE(money("5").isWithinPercentOf(money("-200"), 2.5));
    }

    SECTION("Zero amounts and bases")
    {
        REQUIRE(Amount{}.isWithinPercentOf(Amount{}, 0.0));
        REQUIRE_FALSE(money("1").isWithinPercentOf(Amount{}, 100.0));
        REQUIRE_FALSE(money("0.01").isWithinPercentOf(money("100"), 0.0));
    }

    SECTION("Large amounts do not overflow the comparison")
    {
        const auto base = money("900000000000000");
        REQUIRE(money("90000000000000").isWithinPercentOf(base, 10.0));
        REQUIRE_FALSE(money("90000000000000.0001").isWithinPercentOf(base, 10.0));
    }

    REQUIRE_THAT(money("1234.5").toDouble(), WithinAbs(1234.5, 1e-9));
}

TEST_CASE("PaymentCandidate - matching amount", "[amount][candidate]")
{
    auto candidate = test_utils::makeCandidate(1, "100.00", test_utils::makeDate(2025, 1, 15));

    SECTION("Without payments the full due amount is outstanding")
    {
        REQUIRE(candidate.matchingAmount() == money("100"));
    }

    SECTION("Partial payments reduce the outstanding amount")
    {
        candidate.amount_paid = money("40");
        REQUIRE(candidate.matchingAmount() == money("60"));
    }

    SECTION("Overpayment clamps to zero")
    {
        candidate.amount_paid = money("150");
        REQUIRE(candidate.matchingAmount().isZero());
    }

    SECTION("Credit notes compare by magnitude")
    {
        candidate.amount_due = money("-500");
        REQUIRE(candidate.matchingAmount() == money("500"));

        auto tx = test_utils::makeTransaction("-500.00", test_utils::makeDate(2025, 1, 15));
        REQUIRE(payment::amountDifference(tx, candidate).isZero());
    }
}

TEST_CASE("daysBetween is symmetric", "[amount][date]")
{
    using test_utils::makeDate;
    REQUIRE(payment::daysBetween(makeDate(2025, 1, 15), makeDate(2025, 1, 20)) == 5);
    REQUIRE(payment::daysBetween(makeDate(2025, 1, 20), makeDate(2025, 1, 15)) == 5);
    REQUIRE(payment::daysBetween(makeDate(2024, 12, 31), makeDate(2025, 1, 1)) == 1);
    REQUIRE(payment::daysBetween(makeDate(2024, 2, 28), makeDate(2024, 3, 1)) == 2);
}
