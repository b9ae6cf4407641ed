#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "matching/IbanMatcher.hpp"
#include "utils/payment_fixtures.hpp"

using namespace matching;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using test_utils::addDays;
using test_utils::makeCandidate;
using test_utils::makeDate;
using test_utils::makeTransaction;

namespace {

payment::PaymentCandidate withIban(payment::PaymentCandidate candidate, std::string iban)
{
    candidate.iban = std::move(iban);
    return candidate;
}

} // namespace

TEST_CASE("IbanMatcher - full and partial matches", "[matcher][iban]")
{
    const auto day = makeDate(2025, 5, 20);
    auto tx = makeTransaction("1000.00", day, "Bonifico da IT60X0542811101000000123456 fattura 12");
    tx.memo = "rif conto 9876";

    const std::vector<payment::PaymentCandidate> candidates = {
        withIban(makeCandidate(1, "1000.00", day), "IT60 X054 2811 1010 0000 0123 456"),
        withIban(makeCandidate(2, "1000.00", day), "DE89370400440532013000"),
        withIban(makeCandidate(3, "1010.00", addDays(day, 2)), "DE89370400440532019876"),
        withIban(makeCandidate(4, "1000.00", day), "XX123"),
        withIban(makeCandidate(5, "1000.00", addDays(day, 40)), "IT60X0542811101000000123456"),
        makeCandidate(6, "1000.00", day),
    };

    SECTION("Default configuration")
    {
        IbanMatcher matcher;
        auto results = matcher.match(tx, candidates);
        REQUIRE(results.size() == 2);

        const auto& full = results[0];
        REQUIRE(full.candidateId() == 1);
        REQUIRE(full.type() == payment::MatchType::Iban);
        REQUIRE_THAT(full.confidence(), WithinAbs(0.95, 1e-9));
        REQUIRE(full.matchedFields() == std::vector<std::string>{"iban"});
        REQUIRE_THAT(full.reason(), ContainsSubstring("IBAN match (Italy)"));
        REQUIRE_THAT(full.reason(), ContainsSubstring("IT60X0...3456"));
        REQUIRE_THAT(full.reason(), ContainsSubstring("exact amount"));
        REQUIRE_THAT(full.reason(), ContainsSubstring("same date"));

        const auto& partial = results[1];
        REQUIRE(partial.candidateId() == 3);
        REQUIRE_THAT(partial.confidence(), WithinAbs(0.79, 1e-9));
        REQUIRE(partial.hasField("iban"));
        REQUIRE(partial.hasField("iban_last4"));
        REQUIRE_THAT(partial.reason(), ContainsSubstring("9876"));
        REQUIRE_THAT(partial.reason(), ContainsSubstring("2 days apart"));
    }

    SECTION("Partial matching disabled")
    {
        IbanMatcherConfig config;
        config.partial_match = false;
        IbanMatcher matcher(config);

        auto results = matcher.match(tx, candidates);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].candidateId() == 1);
    }

    SECTION("Wider date tolerance admits the late candidate")
    {
        IbanMatcherConfig config;
        config.date_tolerance_days = 60;
        IbanMatcher matcher(config);

        auto results = matcher.match(tx, candidates);
        REQUIRE(results.size() == 3);
        REQUIRE(results[1].candidateId() == 5);
        REQUIRE_THAT(results[1].confidence(), WithinAbs(0.95, 1e-9));
    }
}

TEST_CASE("IbanMatcher - structured counterparty IBAN", "[matcher][iban]")
{
    const auto day = makeDate(2025, 5, 20);
    auto tx = makeTransaction("480.00", day, "SEPA CREDIT TRANSFER");
    tx.counterparty_iban = "NL91ABNA0417164300";

    const std::vector<payment::PaymentCandidate> candidates = {
        withIban(makeCandidate(1, "500.00", addDays(day, -5)), "nl91 abna 0417 1643 00"),
    };

    IbanMatcher matcher;
    auto results = matcher.match(tx, candidates);
    REQUIRE(results.size() == 1);
    REQUIRE_THAT(results[0].confidence(), WithinAbs(0.92, 1e-9));
    REQUIRE_THAT(results[0].reason(), ContainsSubstring("Netherlands"));
    REQUIRE_THAT(results[0].reason(), ContainsSubstring("amount diff 20.00"));
    REQUIRE_THAT(results[0].reason(), ContainsSubstring("5 days apart"));
}

TEST_CASE("IbanMatcher - amount boost at the tolerance boundary", "[matcher][iban]")
{
    const auto day = makeDate(2025, 5, 20);
    const auto tx = makeTransaction("107.00", day, "Bonifico da DE89370400440532013000");

    const std::vector<payment::PaymentCandidate> candidates = {
        withIban(makeCandidate(1, "100.00", addDays(day, 5)), "DE89370400440532013000"),
        withIban(makeCandidate(2, "99.99", addDays(day, 5)), "DE89370400440532013000"),
    };

    IbanMatcherConfig config;
    config.amount_tolerance_pct = 7.0;
    IbanMatcher matcher(config);

    auto results = matcher.match(tx, candidates);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].candidateId() == 1);
    REQUIRE_THAT(results[0].confidence(), WithinAbs(0.92, 1e-9));
    REQUIRE(results[1].candidateId() == 2);
    REQUIRE_THAT(results[1].confidence(), WithinAbs(0.90, 1e-9));
}

TEST_CASE("IbanMatcher - extraction", "[matcher][iban]")
{
    SECTION("Finds several IBANs in one text")
    {
        auto found = IbanMatcher::findIbans("pay IT60X0542811101000000123456 or de89370400440532013000 today");
        REQUIRE(found.size() == 2);
        REQUIRE(found[0] == "IT60X0542811101000000123456");
        REQUIRE(found[1] == "DE89370400440532013000");
    }

    SECTION("Transaction fields are combined and validated")
    {
        auto tx = makeTransaction("1.00", makeDate(2025, 1, 1), "no iban here");
        tx.reference = "BE68539007547034";
        tx.counterparty_iban = "US00123";

        auto ibans = IbanMatcher::extractIbans(tx);
        REQUIRE(ibans.size() == 1);
        REQUIRE(ibans.count("BE68539007547034") == 1);
    }

    SECTION("Nothing to extract")
    {
        REQUIRE(IbanMatcher::findIbans("").empty());
        REQUIRE(IbanMatcher::findIbans("fattura 2025/001").empty());
    }
}

TEST_CASE("IbanMatcher - edge cases", "[matcher][iban]")
{
    IbanMatcher matcher;
    REQUIRE(matcher.name() == "iban");
    REQUIRE(matcher.match(makeTransaction("1.00", makeDate(2025, 1, 1)), {}).empty());

    IbanMatcherConfig config;
    config.date_tolerance_days = -1;
    REQUIRE_THROWS_AS(IbanMatcher(config), ConfigurationError);
}
