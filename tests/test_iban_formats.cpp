#include <catch2/catch_test_macros.hpp>
#include "iban/IbanFormats.hpp"

#include <algorithm>
#include <regex>

TEST_CASE("IbanFormats - catalog round-trip for every country", "[iban]")
{
    const auto countries = iban::supportedCountries();
    REQUIRE(countries.size() == 30);
    REQUIRE(std::is_sorted(countries.begin(), countries.end()));

    for (const auto& code : countries)
    {
        INFO("Country: " << code);
        const auto* format = iban::formatFor(code);
        REQUIRE(format != nullptr);
        REQUIRE(format->country_code == code);
        REQUIRE(format->example.size() == format->length);

        REQUIRE(iban::detectCountry(format->example) == code);
        REQUIRE(iban::validateLength(format->example));
        REQUIRE(iban::countryName(format->example) == format->country_name);
        REQUIRE(iban::exampleFor(code) == format->example);

        // The example must satisfy its own layout
        REQUIRE(std::regex_match(format->example, std::regex(format->fullPattern())));
    }
}

TEST_CASE("IbanFormats - lookups", "[iban]")
{
    SECTION("Country codes are case-insensitive")
    {
        REQUIRE(iban::formatFor("it") != nullptr);
        REQUIRE(iban::formatFor("It")->country_name == "Italy");
        REQUIRE(iban::detectCountry("de89370400440532013000") == "DE");
    }

    SECTION("Unknown countries are reported as absent")
    {
        REQUIRE(iban::formatFor("US") == nullptr);
        REQUIRE(iban::formatFor("ITA") == nullptr);
        REQUIRE_FALSE(iban::detectCountry("US12345678901234"));
        REQUIRE_FALSE(iban::detectCountry("I"));
        REQUIRE_FALSE(iban::countryName("XX00"));
        REQUIRE_FALSE(iban::exampleFor("ZZ"));
    }

    SECTION("Length validation")
    {
        REQUIRE(iban::validateLength("IT60X0542811101000000123456"));
        REQUIRE_FALSE(iban::validateLength("IT60X054281110100000012345"));
        REQUIRE_FALSE(iban::validateLength("IT60X05428111010000001234567"));
        REQUIRE_FALSE(iban::validateLength(""));
    }

    SECTION("Known lengths")
    {
        REQUIRE(iban::formatFor("NO")->length == 15);
        REQUIRE(iban::formatFor("MT")->length == 31);
        REQUIRE(iban::formatFor("DE")->length == 22);
        REQUIRE(iban::formatFor("IT")->length == 27);
    }
}

TEST_CASE("IbanFormats - normalize", "[iban]")
{
    REQUIRE(iban::normalize("it60 x054 2811 1010 0000 0123 456") == "IT60X0542811101000000123456");
    REQUIRE(iban::normalize("DE89-3704-0044") == "DE8937040044");
    REQUIRE(iban::normalize("") == "");
}

TEST_CASE("IbanFormats - combined pattern finds IBANs in free text", "[iban]")
{
    const std::regex re(iban::combinedPattern(), std::regex::ECMAScript | std::regex::icase);

    std::smatch m;
    std::string text = "Bonifico a favore di ROSSI IBAN IT60X0542811101000000123456 fattura 12";
    REQUIRE(std::regex_search(text, m, re));
    REQUIRE(m.str() == "IT60X0542811101000000123456");

    std::string plain = "Pagamento fattura 2025/001";
    REQUIRE_FALSE(std::regex_search(plain, m, re));
}
