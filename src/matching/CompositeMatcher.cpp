#include "CompositeMatcher.hpp"
#include "FuzzyStringMatcher.hpp"
#include "Scoring.hpp"
#include "processing/RapidFuzzMatcher.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <system_error>
#include <unordered_map>
#include <plog/Log.h>

namespace matching
{

namespace
{

std::optional<std::size_t> indexOf(const std::vector<payment::PaymentCandidate>& filtered,
                                   const payment::PaymentCandidate& candidate)
{
    for (std::size_t i = 0; i < filtered.size(); ++i)
    {
        if (&filtered[i] == &candidate)
            return i;
    }
    return std::nullopt;
}

std::vector<std::string> transactionTexts(const payment::Transaction& tx)
{
    std::vector<std::string> texts;
    auto add = [&texts](const std::optional<std::string>& text)
    {
        if (text && !text->empty())
            texts.push_back(*text);
    };
    add(tx.description);
    add(tx.reference);
    add(tx.counterparty);
    add(tx.memo);
    return texts;
}

std::string percent(double value)
{
    return std::to_string(std::lround(value * 100.0)) + "%";
}

void sortByConfidence(std::vector<payment::MatchResult>& results)
{
    std::stable_sort(results.begin(), results.end(),
                     [](const payment::MatchResult& a, const payment::MatchResult& b)
                     { return a.confidence() > b.confidence(); });
}

} // namespace

CompositeMatcher::CompositeMatcher(std::vector<StrategyPtr> strategies, CompositeMatcherConfig config,
                                   std::shared_ptr<const processing::IFuzzyMatcher> similarity,
                                   Diagnostics diagnostics)
    : strategies_(std::move(strategies))
    , config_(config)
    , similarity_(std::move(similarity))
    , diagnostics_(diagnostics)
    , metrics_(std::make_unique<MatchingMetrics>())
{
    if (auto err = config_.validate())
        throw ConfigurationError(*err);

    strategies_.erase(std::remove(strategies_.begin(), strategies_.end(), nullptr), strategies_.end());

    if (!similarity_)
        similarity_ = std::make_shared<processing::RapidFuzzMatcher>();
}

CompositeMatcher::~CompositeMatcher() = default;

std::vector<payment::MatchResult> CompositeMatcher::match(
    const payment::Transaction& transaction, const std::vector<payment::PaymentCandidate>& candidates) const
{
    if (candidates.empty() || strategies_.empty())
        return {};

    std::vector<const payment::PaymentCandidate*> window;
    std::vector<payment::PaymentCandidate> filtered;
    for (const auto& candidate : candidates)
    {
        if (withinDateWindow(transaction, candidate, config_.date_tolerance_days))
        {
            window.push_back(&candidate);
            filtered.push_back(candidate);
        }
    }

    if (diagnostics_.verbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "Composite match for " << diagnostics_.describe(transaction)
                                               << ": " << filtered.size() << "/" << candidates.size()
                                               << " candidate(s) within " << config_.date_tolerance_days << " days";
    }

    if (filtered.empty())
        return {};

    const auto start = std::chrono::steady_clock::now();
    const auto outcomes = runStrategies(transaction, filtered);

    auto results = config_.merge_mode == MergeMode::StrategyDedup
                       ? mergeDedup(transaction, window, filtered, outcomes)
                       : mergeWeighted(transaction, window, filtered, outcomes);
    sortByConfidence(results);

    metrics_->record(name(),
                     std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start),
                     results);
    return results;
}

std::vector<StrategyOutcome> CompositeMatcher::runStrategies(
    const payment::Transaction& transaction, const std::vector<payment::PaymentCandidate>& candidates) const
{
    std::vector<std::future<StrategyOutcome>> futures;
    std::vector<StrategyOutcome> outcomes;
    futures.reserve(strategies_.size());
    outcomes.reserve(strategies_.size());

    auto task = [this, &transaction, &candidates](const StrategyPtr& strategy)
    {
        return run_strategy(strategy->name(), transaction, diagnostics_,
                            [&] { return strategy->match(transaction, candidates); });
    };

    for (const auto& strategy : strategies_)
    {
        try
        {
            futures.push_back(std::async(std::launch::async, task, strategy));
        }
        catch (const std::system_error& e)
        {
            // No thread available: evaluate in place, results stay identical
            PLOG_WARNING_(Diagnostics::kLogInstance) << "Could not start task for strategy '" << strategy->name()
                                                     << "', running inline: " << e.what();
            std::promise<StrategyOutcome> ready;
            ready.set_value(task(strategy));
            futures.push_back(ready.get_future());
        }
    }

    // Joined in strategy order regardless of completion order
    for (auto& future : futures)
    {
        outcomes.push_back(future.get());
        metrics_->record(outcomes.back());
    }

    return outcomes;
}

double CompositeMatcher::descriptionSimilarity(const payment::Transaction& transaction,
                                               const payment::PaymentCandidate& candidate) const
{
    const auto candidate_texts = candidateTexts(candidate);
    if (candidate_texts.empty())
        return 0.0;

    double best = 0.0;
    for (const auto& text : transactionTexts(transaction))
    {
        if (auto hit = similarity_->findBestMatch(text, candidate_texts, 0.0, config_.description_algorithm))
            best = std::max(best, hit->score);
    }
    return best;
}

std::vector<payment::MatchResult> CompositeMatcher::mergeWeighted(
    const payment::Transaction& transaction, const std::vector<const payment::PaymentCandidate*>& window,
    const std::vector<payment::PaymentCandidate>& filtered, const std::vector<StrategyOutcome>& outcomes) const
{
    std::vector<std::vector<std::string>> flagged_by(filtered.size());
    for (const auto& outcome : outcomes)
    {
        for (const auto& result : outcome.results)
        {
            auto idx = indexOf(filtered, result.candidate());
            if (!idx)
                continue;
            auto& names = flagged_by[*idx];
            if (std::find(names.begin(), names.end(), outcome.strategy_name) == names.end())
                names.push_back(outcome.strategy_name);
        }
    }

    const double weight_sum = config_.amount_weight + config_.date_weight + config_.description_weight;

    std::vector<payment::MatchResult> results;
    for (std::size_t i = 0; i < filtered.size(); ++i)
    {
        if (flagged_by[i].empty())
            continue;

        const auto& candidate = *window[i];
        const double amount = amountScore(transaction, candidate);
        const double date = dateScore(transaction, candidate);
        const double description = descriptionScore(descriptionSimilarity(transaction, candidate));

        double score =
            (amount * config_.amount_weight + date * config_.date_weight + description * config_.description_weight) /
            weight_sum;
        score = std::clamp(score, std::min({amount, date, description}), std::max({amount, date, description}));

        if (score < config_.min_confidence)
        {
            if (diagnostics_.verbose())
            {
                PLOG_DEBUG_(Diagnostics::kLogInstance)
                    << "candidate " << diagnostics_.describe(candidate) << " dropped at " << percent(score) << " (min "
                    << percent(config_.min_confidence) << ")";
            }
            continue;
        }

        std::vector<std::string> fields;
        if (amount >= 0.85)
            fields.emplace_back("amount");
        if (date >= 0.85)
            fields.emplace_back("date");
        if (description >= 0.85)
            fields.emplace_back("description");

        std::string reason = "Composite match (amount " + percent(amount) + ", date " + percent(date) + ", desc " +
                             percent(description) + ") -> " + percent(score) + "; flagged by ";
        for (std::size_t n = 0; n < flagged_by[i].size(); ++n)
        {
            if (n > 0)
                reason += ", ";
            reason += flagged_by[i][n];
        }

        payment::MatchResult result(transaction, candidate, payment::Confidence(score), payment::MatchType::Composite,
                                    std::move(reason), std::move(fields));
        result.setStrategy(name());
        results.push_back(std::move(result));
    }
    return results;
}

std::vector<payment::MatchResult> CompositeMatcher::mergeDedup(
    const payment::Transaction& transaction, const std::vector<const payment::PaymentCandidate*>& window,
    const std::vector<payment::PaymentCandidate>& filtered, const std::vector<StrategyOutcome>& outcomes) const
{
    struct Pick
    {
        const payment::MatchResult* result;
        const std::string* strategy;
        std::size_t index;
    };

    // Keyed by candidate id; strategies are visited in order so the first one wins ties
    std::unordered_map<std::uint64_t, Pick> best;
    for (const auto& outcome : outcomes)
    {
        for (const auto& result : outcome.results)
        {
            auto idx = indexOf(filtered, result.candidate());
            if (!idx)
                continue;

            auto [it, inserted] = best.try_emplace(result.candidateId(), Pick{&result, &outcome.strategy_name, *idx});
            if (!inserted && result.confidence() > it->second.result->confidence())
                it->second = Pick{&result, &outcome.strategy_name, *idx};
        }
    }

    std::vector<Pick> picks;
    picks.reserve(best.size());
    for (const auto& [id, pick] : best)
        picks.push_back(pick);
    std::sort(picks.begin(), picks.end(), [](const Pick& a, const Pick& b) { return a.index < b.index; });

    std::vector<payment::MatchResult> results;
    results.reserve(picks.size());
    for (const auto& pick : picks)
    {
        // Rebind to the caller's candidate; the filtered copies die with match()
        const auto& source = *pick.result;
        payment::MatchResult result(transaction, *window[pick.index], payment::Confidence(source.confidence()),
                                    source.type(), source.reason(), source.matchedFields());
        result.setStrategy(*pick.strategy);
        results.push_back(std::move(result));
    }
    return results;
}

} // namespace matching
