#pragma once

#include "Diagnostics.hpp"
#include "payment/MatchResult.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <plog/Log.h>
#include <utility>
#include <exception>

#include "../utils/ErrorReporter.hpp"

namespace matching {

// Outcome of one strategy evaluation inside the composite matcher
struct StrategyOutcome
{
    std::vector<payment::MatchResult> results;
    bool succeeded = true;
    std::optional<std::string> error;
    std::chrono::microseconds duration{0};
    std::string strategy_name;
};

// Run a strategy (callable returning std::vector<MatchResult>) for one transaction and contain its failures.
// A throwing strategy yields an empty, failed outcome; the exception never leaves this function.
template<typename Fn>
StrategyOutcome run_strategy(const std::string& strategy_name, const payment::Transaction& transaction,
                             const Diagnostics& diagnostics, Fn&& fn)
{
    using namespace std::chrono;
    StrategyOutcome outcome;
    outcome.strategy_name = strategy_name;

    auto start = steady_clock::now();
    try
    {
        outcome.results = fn();
        outcome.duration = duration_cast<microseconds>(steady_clock::now() - start);
        if (diagnostics.verbose()) {
            PLOG_INFO_(Diagnostics::kLogInstance) << "Strategy '" << strategy_name << "' produced "
                << outcome.results.size() << " result(s) for " << transaction.id << " in "
                << outcome.duration.count() << "us";
        }
        return outcome;
    }
    catch (const std::exception& ex)
    {
        outcome.duration = duration_cast<microseconds>(steady_clock::now() - start);
        outcome.results.clear();
        outcome.succeeded = false;
        outcome.error = ex.what();
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Strategy '" << strategy_name << "' failed on "
            << diagnostics.describe(transaction) << " after " << outcome.duration.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Matching,
            "Matcher strategy failed", ex.what(), {strategy_name, transaction.id, {}});
        return outcome;
    }
    catch (...)
    {
        outcome.duration = duration_cast<microseconds>(steady_clock::now() - start);
        outcome.results.clear();
        outcome.succeeded = false;
        outcome.error = "unknown exception";
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Strategy '" << strategy_name
            << "' failed with unknown exception on " << diagnostics.describe(transaction) << " after "
            << outcome.duration.count() << "us";
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Matching,
            "Matcher strategy failed", "unknown exception", {strategy_name, transaction.id, {}});
        return outcome;
    }
}

} // namespace matching
