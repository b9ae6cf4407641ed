#include "ExactAmountMatcher.hpp"
#include "Scoring.hpp"

namespace matching
{

ExactAmountMatcher::ExactAmountMatcher() : ExactAmountMatcher(ExactMatcherConfig{})
{
}

ExactAmountMatcher::ExactAmountMatcher(ExactMatcherConfig config) : config_(std::move(config))
{
    if (auto err = config_.validate())
        throw ConfigurationError(*err);
}

std::vector<payment::MatchResult> ExactAmountMatcher::match(
    const payment::Transaction& transaction, const std::vector<payment::PaymentCandidate>& candidates) const
{
    std::vector<payment::MatchResult> results;

    for (const auto& candidate : candidates)
    {
        if (!withinDateWindow(transaction, candidate, config_.date_window_days))
            continue;

        if (!isExactAmount(transaction, candidate))
            continue;

        std::vector<std::string> fields = {"amount"};
        if (payment::daysBetween(transaction.date, candidate.due_date) == 0)
            fields.emplace_back("date");

        results.emplace_back(transaction, candidate, payment::Confidence(1.0), payment::MatchType::Exact,
                             "Exact amount match: " + candidate.matchingAmount().toString(), std::move(fields));
    }

    // All results share confidence 1.0; input order is already the ranking.
    return results;
}

} // namespace matching
