#include "MatcherConfig.hpp"
#include "config/ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <cmath>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace matching
{

namespace
{

const std::vector<std::string>& knownStrategies()
{
    static const std::vector<std::string> names = {"exact", "date_window", "fuzzy", "iban"};
    return names;
}

bool inUnitRange(double v) { return !std::isnan(v) && v >= 0.0 && v <= 1.0; }

std::string fmt(double v) { return std::to_string(v); }

template<typename T>
void readValue(const toml::table& section, std::string_view key, T& target)
{
    if (auto v = section[key].value<T>())
        target = *v;
}

void reportBadValue(const std::string& key, const std::string& value)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Invalid matching configuration value, keeping default",
                                        key + " = \"" + value + "\"", {{}, {}, key});
}

} // namespace

std::optional<std::string> ExactMatcherConfig::validate() const
{
    if (date_window_days && *date_window_days < 0)
        return "exact.date_window_days must be >= 0, got " + std::to_string(*date_window_days);
    return std::nullopt;
}

std::optional<std::string> DateWindowMatcherConfig::validate() const
{
    if (date_window_days < 0)
        return "date_window.date_window_days must be >= 0, got " + std::to_string(date_window_days);
    if (!inUnitRange(min_confidence))
        return "date_window.min_confidence must be between 0.0 and 1.0, got " + fmt(min_confidence);
    return std::nullopt;
}

std::optional<std::string> FuzzyMatcherConfig::validate() const
{
    if (std::isnan(min_similarity) || min_similarity < 0.0 || min_similarity > 100.0)
        return "fuzzy.min_similarity must be between 0-100, got " + fmt(min_similarity);
    if (date_tolerance_days < 0)
        return "fuzzy.date_tolerance_days must be >= 0, got " + std::to_string(date_tolerance_days);
    if (std::isnan(amount_tolerance_pct) || amount_tolerance_pct < 0.0)
        return "fuzzy.amount_tolerance_pct must be >= 0, got " + fmt(amount_tolerance_pct);
    return std::nullopt;
}

std::optional<std::string> IbanMatcherConfig::validate() const
{
    if (date_tolerance_days < 0)
        return "iban.date_tolerance_days must be >= 0, got " + std::to_string(date_tolerance_days);
    if (std::isnan(amount_tolerance_pct) || amount_tolerance_pct < 0.0)
        return "iban.amount_tolerance_pct must be >= 0, got " + fmt(amount_tolerance_pct);
    return std::nullopt;
}

std::optional<std::string> CompositeMatcherConfig::validate() const
{
    if (!inUnitRange(amount_weight) || !inUnitRange(date_weight) || !inUnitRange(description_weight))
        return "composite weights must each be between 0.0 and 1.0";

    const double sum = amount_weight + date_weight + description_weight;
    if (std::abs(sum - 1.0) > kWeightSumTolerance)
        return "Weights must sum to 1.0, got " + fmt(sum);

    if (!inUnitRange(min_confidence))
        return "composite.min_confidence must be between 0.0 and 1.0, got " + fmt(min_confidence);
    if (date_tolerance_days < 0)
        return "composite.date_tolerance_days must be >= 0, got " + std::to_string(date_tolerance_days);
    return std::nullopt;
}

std::optional<std::string> MatchingConfig::validate() const
{
    for (auto err : {composite.validate(), exact.validate(), date_window.validate(), fuzzy.validate(), iban.validate()})
    {
        if (err)
            return err;
    }

    if (preview_bytes < 1)
        return "matching.preview_bytes must be >= 1, got " + std::to_string(preview_bytes);

    const auto& known = knownStrategies();
    for (std::size_t i = 0; i < strategies.size(); ++i)
    {
        const auto& name = strategies[i];
        if (std::find(known.begin(), known.end(), name) == known.end())
            return "Unknown matcher strategy '" + name + "'";
        if (std::find(strategies.begin(), strategies.begin() + static_cast<std::ptrdiff_t>(i), name) !=
            strategies.begin() + static_cast<std::ptrdiff_t>(i))
            return "Matcher strategy '" + name + "' listed twice";
    }
    return std::nullopt;
}

std::optional<processing::MatchAlgorithm> parseAlgorithm(std::string_view name)
{
    using processing::MatchAlgorithm;
    if (name == "ratio")
        return MatchAlgorithm::Ratio;
    if (name == "partial_ratio")
        return MatchAlgorithm::PartialRatio;
    if (name == "token_sort_ratio")
        return MatchAlgorithm::TokenSortRatio;
    if (name == "token_set_ratio")
        return MatchAlgorithm::TokenSetRatio;
    return std::nullopt;
}

std::string_view toString(processing::MatchAlgorithm algorithm)
{
    using processing::MatchAlgorithm;
    switch (algorithm)
    {
    case MatchAlgorithm::Ratio:
        return "ratio";
    case MatchAlgorithm::PartialRatio:
        return "partial_ratio";
    case MatchAlgorithm::TokenSortRatio:
        return "token_sort_ratio";
    case MatchAlgorithm::TokenSetRatio:
        return "token_set_ratio";
    }
    return "ratio";
}

std::optional<MergeMode> parseMergeMode(std::string_view name)
{
    if (name == "weighted")
        return MergeMode::Weighted;
    if (name == "dedup")
        return MergeMode::StrategyDedup;
    return std::nullopt;
}

std::string_view toString(MergeMode mode)
{
    return mode == MergeMode::StrategyDedup ? "dedup" : "weighted";
}

bool registerMatchingConfig(ConfigManager& manager, MatchingConfig& config)
{
    bool ok = true;

    ok &= manager.registerTable(
        "matching",
        {[&config](const toml::table& t)
         {
             if (auto mode = t["merge_mode"].value<std::string>())
             {
                 if (auto parsed = parseMergeMode(*mode))
                     config.composite.merge_mode = *parsed;
                 else
                     reportBadValue("matching.merge_mode", *mode);
             }
             if (auto* arr = t["strategies"].as_array())
             {
                 std::vector<std::string> names;
                 for (const auto& node : *arr)
                 {
                     if (auto s = node.value<std::string>())
                         names.push_back(*s);
                 }
                 config.strategies = std::move(names);
             }
             readValue(t, "verbose_diagnostics", config.verbose_diagnostics);
             readValue(t, "preview_bytes", config.preview_bytes);
         }},
        {"merge_mode", "strategies", "verbose_diagnostics", "preview_bytes"});

    ok &= manager.registerTable(
        "matching.composite",
        {[&config](const toml::table& t)
         {
             auto& c = config.composite;
             readValue(t, "amount_weight", c.amount_weight);
             readValue(t, "date_weight", c.date_weight);
             readValue(t, "description_weight", c.description_weight);
             readValue(t, "min_confidence", c.min_confidence);
             readValue(t, "date_tolerance_days", c.date_tolerance_days);
             if (auto algo = t["description_algorithm"].value<std::string>())
             {
                 if (auto parsed = parseAlgorithm(*algo))
                     c.description_algorithm = *parsed;
                 else
                     reportBadValue("matching.composite.description_algorithm", *algo);
             }
         }},
        {"amount_weight", "date_weight", "description_weight", "min_confidence", "date_tolerance_days",
         "description_algorithm"});

    ok &= manager.registerTable(
        "matching.exact",
        {[&config](const toml::table& t)
         {
             if (auto days = t["date_window_days"].value<int>())
             {
                 // 0 keeps the window unrestricted
                 if (*days == 0)
                     config.exact.date_window_days.reset();
                 else
                     config.exact.date_window_days = *days;
             }
         }},
        {"date_window_days"});

    ok &= manager.registerTable(
        "matching.date_window",
        {[&config](const toml::table& t)
         {
             readValue(t, "date_window_days", config.date_window.date_window_days);
             readValue(t, "min_confidence", config.date_window.min_confidence);
         }},
        {"date_window_days", "min_confidence"});

    ok &= manager.registerTable(
        "matching.fuzzy",
        {[&config](const toml::table& t)
         {
             auto& f = config.fuzzy;
             readValue(t, "min_similarity", f.min_similarity);
             readValue(t, "date_tolerance_days", f.date_tolerance_days);
             readValue(t, "amount_tolerance_pct", f.amount_tolerance_pct);
             if (auto algo = t["algorithm"].value<std::string>())
             {
                 if (auto parsed = parseAlgorithm(*algo))
                     f.algorithm = *parsed;
                 else
                     reportBadValue("matching.fuzzy.algorithm", *algo);
             }
         }},
        {"min_similarity", "date_tolerance_days", "amount_tolerance_pct", "algorithm"});

    ok &= manager.registerTable(
        "matching.iban",
        {[&config](const toml::table& t)
         {
             readValue(t, "date_tolerance_days", config.iban.date_tolerance_days);
             readValue(t, "amount_tolerance_pct", config.iban.amount_tolerance_pct);
             readValue(t, "partial_match", config.iban.partial_match);
         }},
        {"date_tolerance_days", "amount_tolerance_pct", "partial_match"});

    if (!ok)
    {
        PLOG_ERROR << "Failed to register matching configuration tables: " << manager.lastError();
    }
    return ok;
}

} // namespace matching
