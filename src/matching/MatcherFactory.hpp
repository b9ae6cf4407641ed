#pragma once

#include "CompositeMatcher.hpp"
#include "MatcherConfig.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace matching
{

// Builds one strategy by its configuration name ("exact", "date_window", "fuzzy", "iban").
// Throws ConfigurationError for unknown names or invalid settings.
[[nodiscard]] std::shared_ptr<const IMatcherStrategy> createStrategy(
    std::string_view name, const MatchingConfig& config,
    std::shared_ptr<const processing::IFuzzyMatcher> similarity = nullptr);

// Validates the whole configuration and builds the composite with the configured
// strategies in order. Trace verbosity belongs to the returned matcher and its
// strategies only. Throws ConfigurationError.
[[nodiscard]] std::unique_ptr<CompositeMatcher> createCompositeMatcher(const MatchingConfig& config);

// Same as createCompositeMatcher, but reports configuration errors through
// ErrorReporter and returns nullptr instead of throwing.
[[nodiscard]] std::unique_ptr<CompositeMatcher> tryCreateCompositeMatcher(const MatchingConfig& config) noexcept;

// Reads [logging] and [matching.*] from one TOML file (missing file: defaults),
// brings up the log files and builds the composite. Problems are reported
// through ErrorReporter; nullptr when no matcher could be built.
[[nodiscard]] std::unique_ptr<CompositeMatcher> loadCompositeMatcher(const std::string& config_path);

} // namespace matching
