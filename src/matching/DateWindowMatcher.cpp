#include "DateWindowMatcher.hpp"
#include "Scoring.hpp"

#include <algorithm>
#include <cmath>

namespace matching
{

DateWindowMatcher::DateWindowMatcher() : DateWindowMatcher(DateWindowMatcherConfig{})
{
}

DateWindowMatcher::DateWindowMatcher(DateWindowMatcherConfig config) : config_(config)
{
    if (auto err = config_.validate())
        throw ConfigurationError(*err);
}

std::vector<payment::MatchResult> DateWindowMatcher::match(
    const payment::Transaction& transaction, const std::vector<payment::PaymentCandidate>& candidates) const
{
    std::vector<payment::MatchResult> results;

    for (const auto& candidate : candidates)
    {
        if (!withinDateWindow(transaction, candidate, config_.date_window_days))
            continue;

        const double amount = amountScore(transaction, candidate);
        const double date = dateScore(transaction, candidate);
        if (amount <= 0.0 || date <= 0.0)
            continue;

        const double confidence = std::min(kMaxConfidence, kMaxConfidence * (amount + date) / 2.0);
        if (confidence < config_.min_confidence)
            continue;

        std::vector<std::string> fields;
        if (amount >= 0.85)
            fields.emplace_back("amount");
        if (date >= 0.85)
            fields.emplace_back("date");

        const long days = payment::daysBetween(transaction.date, candidate.due_date);
        std::string reason = "Date window match: amount score " + std::to_string(std::lround(amount * 100)) +
                             "%, " + (days == 0 ? std::string("same date") : std::to_string(days) + " days apart");

        results.emplace_back(transaction, candidate, payment::Confidence(confidence), payment::MatchType::DateWindow,
                             std::move(reason), std::move(fields));
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const payment::MatchResult& a, const payment::MatchResult& b)
                     { return a.confidence() > b.confidence(); });
    return results;
}

} // namespace matching
