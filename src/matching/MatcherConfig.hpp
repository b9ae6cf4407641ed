#pragma once

#include "processing/IFuzzyMatcher.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class ConfigManager;

namespace matching
{

// Raised by matcher constructors when their configuration is invalid.
// Never raised from match().
class ConfigurationError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

struct ExactMatcherConfig
{
    std::optional<int> date_window_days; // unrestricted when empty

    [[nodiscard]] std::optional<std::string> validate() const;
};

struct DateWindowMatcherConfig
{
    int date_window_days = 7;
    double min_confidence = 0.6;

    [[nodiscard]] std::optional<std::string> validate() const;
};

struct FuzzyMatcherConfig
{
    double min_similarity = 85.0;   // 0-100
    int date_tolerance_days = 14;
    double amount_tolerance_pct = 5.0;
    processing::MatchAlgorithm algorithm = processing::MatchAlgorithm::Ratio;

    [[nodiscard]] std::optional<std::string> validate() const;
};

struct IbanMatcherConfig
{
    int date_tolerance_days = 30;
    double amount_tolerance_pct = 5.0;
    bool partial_match = true;      // last-4-digit fallback

    [[nodiscard]] std::optional<std::string> validate() const;
};

enum class MergeMode
{
    Weighted,      // one amount/date/description score per flagged candidate
    StrategyDedup  // strongest strategy result per candidate
};

struct CompositeMatcherConfig
{
    double amount_weight = 0.4;
    double date_weight = 0.3;
    double description_weight = 0.3;
    double min_confidence = 0.6;
    int date_tolerance_days = 30;
    MergeMode merge_mode = MergeMode::Weighted;
    processing::MatchAlgorithm description_algorithm = processing::MatchAlgorithm::TokenSetRatio;

    [[nodiscard]] std::optional<std::string> validate() const;
};

struct MatchingConfig
{
    CompositeMatcherConfig composite;
    ExactMatcherConfig exact;
    DateWindowMatcherConfig date_window;
    FuzzyMatcherConfig fuzzy;
    IbanMatcherConfig iban;
    std::vector<std::string> strategies = {"exact", "date_window", "fuzzy", "iban"};
    bool verbose_diagnostics = false;
    int preview_bytes = 80;         // statement text kept in trace lines

    [[nodiscard]] std::optional<std::string> validate() const;
};

inline constexpr double kWeightSumTolerance = 0.01;

[[nodiscard]] std::optional<processing::MatchAlgorithm> parseAlgorithm(std::string_view name);
[[nodiscard]] std::string_view toString(processing::MatchAlgorithm algorithm);
[[nodiscard]] std::optional<MergeMode> parseMergeMode(std::string_view name);
[[nodiscard]] std::string_view toString(MergeMode mode);

/// Registers the [matching] tables on a ConfigManager; values land in config on every load().
/// The referenced config must outlive the manager's loads.
bool registerMatchingConfig(ConfigManager& manager, MatchingConfig& config);

} // namespace matching
