#pragma once

#include "IMatcherStrategy.hpp"
#include "MatcherConfig.hpp"

namespace matching
{

/**
 * @brief Perfect amount match.
 *
 * Every candidate whose outstanding amount equals |tx.amount| within one cent
 * is returned with confidence 1.0 and type "exact". Amounts are compared as
 * exact decimals, so 100.0, 100.00 and 100.000 are the same amount.
 */
class ExactAmountMatcher : public IMatcherStrategy
{
public:
    ExactAmountMatcher();
    explicit ExactAmountMatcher(ExactMatcherConfig config);

    [[nodiscard]] std::string name() const override { return "exact"; }

    [[nodiscard]] std::vector<payment::MatchResult> match(
        const payment::Transaction& transaction,
        const std::vector<payment::PaymentCandidate>& candidates) const override;

    [[nodiscard]] const ExactMatcherConfig& config() const { return config_; }

private:
    ExactMatcherConfig config_;
};

} // namespace matching
