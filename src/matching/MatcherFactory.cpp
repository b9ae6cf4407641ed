#include "MatcherFactory.hpp"
#include "DateWindowMatcher.hpp"
#include "Diagnostics.hpp"
#include "ExactAmountMatcher.hpp"
#include "FuzzyStringMatcher.hpp"
#include "IbanMatcher.hpp"
#include "config/ConfigManager.hpp"
#include "processing/RapidFuzzMatcher.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <algorithm>
#include <plog/Log.h>

namespace matching
{

namespace
{

Diagnostics diagnosticsFor(const MatchingConfig& config)
{
    return Diagnostics(config.verbose_diagnostics, static_cast<std::size_t>(std::max(config.preview_bytes, 1)));
}

} // namespace

std::shared_ptr<const IMatcherStrategy> createStrategy(std::string_view name, const MatchingConfig& config,
                                                       std::shared_ptr<const processing::IFuzzyMatcher> similarity)
{
    if (name == "exact")
        return std::make_shared<ExactAmountMatcher>(config.exact);
    if (name == "date_window")
        return std::make_shared<DateWindowMatcher>(config.date_window);
    if (name == "fuzzy")
        return std::make_shared<FuzzyStringMatcher>(config.fuzzy, std::move(similarity), diagnosticsFor(config));
    if (name == "iban")
        return std::make_shared<IbanMatcher>(config.iban, diagnosticsFor(config));

    throw ConfigurationError("Unknown matcher strategy '" + std::string(name) + "'");
}

std::unique_ptr<CompositeMatcher> createCompositeMatcher(const MatchingConfig& config)
{
    if (auto err = config.validate())
        throw ConfigurationError(*err);

    // One normalizer/similarity engine shared by the fuzzy strategy and the composite
    std::shared_ptr<const processing::IFuzzyMatcher> similarity = std::make_shared<processing::RapidFuzzMatcher>();

    std::vector<CompositeMatcher::StrategyPtr> strategies;
    strategies.reserve(config.strategies.size());
    for (const auto& name : config.strategies)
        strategies.push_back(createStrategy(name, config, similarity));

    auto composite =
        std::make_unique<CompositeMatcher>(std::move(strategies), config.composite, similarity, diagnosticsFor(config));
    PLOG_INFO << "Composite matcher ready: " << composite->strategyCount() << " strateg"
              << (composite->strategyCount() == 1 ? "y" : "ies") << ", merge mode "
              << toString(config.composite.merge_mode)
              << (config.verbose_diagnostics ? ", verbose traces" : "");
    return composite;
}

std::unique_ptr<CompositeMatcher> tryCreateCompositeMatcher(const MatchingConfig& config) noexcept
{
    try
    {
        return createCompositeMatcher(config);
    }
    catch (const ConfigurationError& e)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid matching configuration",
                                          e.what(), {{}, {}, "matching"});
    }
    catch (const std::exception& e)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Failed to create matcher",
                                          e.what());
    }
    return nullptr;
}

std::unique_ptr<CompositeMatcher> loadCompositeMatcher(const std::string& config_path)
{
    ConfigManager manager(config_path);
    utils::LoggingConfig logging;
    MatchingConfig config;
    if (!utils::registerLoggingConfig(manager, logging) || !registerMatchingConfig(manager, config))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Failed to register configuration",
                                          manager.lastError(), {{}, {}, config_path});
        return nullptr;
    }

    // Syntax errors are already reported by the manager; both tables keep their defaults
    if (!manager.load())
        PLOG_WARNING << "Using default matching configuration: " << manager.lastError();

    if (!utils::LogManager::Initialize(logging))
        PLOG_WARNING << "Matching continues without file logs";

    return tryCreateCompositeMatcher(config);
}

} // namespace matching
