#pragma once

#include "Diagnostics.hpp"
#include "IMatcherStrategy.hpp"
#include "MatcherConfig.hpp"
#include "MatchingMetrics.hpp"
#include "StrategyRunner.hpp"
#include "processing/IFuzzyMatcher.hpp"

#include <memory>
#include <vector>

namespace matching
{

/**
 * @brief Runs several strategies concurrently and merges their evidence.
 *
 * Candidates are first restricted to the composite date window. Every
 * strategy then runs on its own task over the same immutable input; a
 * strategy that throws contributes nothing and never affects its siblings.
 *
 * In weighted mode each candidate flagged by at least one strategy receives
 * a single score from amount, date and description agreement. In dedup mode
 * the strongest strategy result per candidate is kept.
 *
 * Output is ordered by confidence (highest first); ties keep the input order
 * of the candidates, independent of task scheduling.
 *
 * Every strategy run is recorded in metrics() under the strategy name, and
 * every merged result list under "composite".
 */
class CompositeMatcher : public IMatcherStrategy
{
public:
    using StrategyPtr = std::shared_ptr<const IMatcherStrategy>;

    explicit CompositeMatcher(std::vector<StrategyPtr> strategies, CompositeMatcherConfig config = {},
                              std::shared_ptr<const processing::IFuzzyMatcher> similarity = nullptr,
                              Diagnostics diagnostics = Diagnostics());
    ~CompositeMatcher() override;

    [[nodiscard]] std::string name() const override { return "composite"; }

    [[nodiscard]] std::vector<payment::MatchResult> match(
        const payment::Transaction& transaction,
        const std::vector<payment::PaymentCandidate>& candidates) const override;

    [[nodiscard]] std::size_t strategyCount() const { return strategies_.size(); }
    [[nodiscard]] const CompositeMatcherConfig& config() const { return config_; }
    [[nodiscard]] const Diagnostics& diagnostics() const { return diagnostics_; }
    [[nodiscard]] const MatchingMetrics& metrics() const { return *metrics_; }
    void resetMetrics() { metrics_->reset(); }

    /// Runs every strategy on its own task and joins them; outcomes are in strategy order
    /// and each one is recorded in metrics().
    [[nodiscard]] std::vector<StrategyOutcome> runStrategies(
        const payment::Transaction& transaction,
        const std::vector<payment::PaymentCandidate>& candidates) const;

    /// Best similarity (0-100) between any transaction text and any candidate text.
    [[nodiscard]] double descriptionSimilarity(const payment::Transaction& transaction,
                                               const payment::PaymentCandidate& candidate) const;

private:
    [[nodiscard]] std::vector<payment::MatchResult> mergeWeighted(
        const payment::Transaction& transaction, const std::vector<const payment::PaymentCandidate*>& window,
        const std::vector<payment::PaymentCandidate>& filtered, const std::vector<StrategyOutcome>& outcomes) const;

    [[nodiscard]] std::vector<payment::MatchResult> mergeDedup(
        const payment::Transaction& transaction, const std::vector<const payment::PaymentCandidate*>& window,
        const std::vector<payment::PaymentCandidate>& filtered, const std::vector<StrategyOutcome>& outcomes) const;

    std::vector<StrategyPtr> strategies_;
    CompositeMatcherConfig config_;
    std::shared_ptr<const processing::IFuzzyMatcher> similarity_;
    Diagnostics diagnostics_;
    std::unique_ptr<MatchingMetrics> metrics_;
};

} // namespace matching
