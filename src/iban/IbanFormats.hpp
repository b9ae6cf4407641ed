#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace iban
{

/**
 * @brief IBAN layout for one country (SWIFT IBAN registry).
 */
struct IbanFormat
{
    std::string country_code;  // ISO 3166-1 alpha-2, e.g. "IT"
    std::string country_name;  // English name, e.g. "Italy"
    std::size_t length;        // Total length including country code and check digits
    std::string pattern;       // ECMAScript regex for the part after the country code
    std::string example;       // Canonical example IBAN

    /// Country code followed by pattern, e.g. "DE\d{20}"
    [[nodiscard]] std::string fullPattern() const { return country_code + pattern; }
};

/**
 * @brief Registry of SEPA/EEA IBAN formats.
 *
 * The catalog is built once on first use and never modified, so every
 * function here may be called concurrently without synchronization.
 * Unknown countries are reported as std::nullopt / false, never as errors.
 */

/// Catalog entry for a country code (case-insensitive), nullptr if not cataloged.
[[nodiscard]] const IbanFormat* formatFor(std::string_view country_code);

/// Country code from the first two characters, if cataloged.
[[nodiscard]] std::optional<std::string> detectCountry(std::string_view iban);

/// True when the country is cataloged and the length matches its format.
[[nodiscard]] bool validateLength(std::string_view iban);

/// English country name for the IBAN's country, if cataloged.
[[nodiscard]] std::optional<std::string> countryName(std::string_view iban);

/// "(?:IT...)|(?:DE...)|..." matching any cataloged IBAN shape (use case-insensitive).
[[nodiscard]] const std::string& combinedPattern();

/// Example IBAN for a country code (case-insensitive).
[[nodiscard]] std::optional<std::string> exampleFor(std::string_view country_code);

/// Sorted list of cataloged country codes.
[[nodiscard]] std::vector<std::string> supportedCountries();

/// Upper-cases and drops every character that is not an ASCII letter or digit.
[[nodiscard]] std::string normalize(std::string_view text);

} // namespace iban
