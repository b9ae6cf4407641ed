#pragma once

#include "IMatcherStrategy.hpp"
#include "MatcherConfig.hpp"

namespace matching
{

/**
 * @brief Amount + date proximity.
 *
 * Confidence is 0.80 * (amountScore + dateScore) / 2 for candidates inside the
 * date window whose amount and date both score above zero, so the strategy
 * never claims more than 0.80 on its own.
 */
class DateWindowMatcher : public IMatcherStrategy
{
public:
    static constexpr double kMaxConfidence = 0.80;

    DateWindowMatcher();
    explicit DateWindowMatcher(DateWindowMatcherConfig config);

    [[nodiscard]] std::string name() const override { return "date_window"; }

    [[nodiscard]] std::vector<payment::MatchResult> match(
        const payment::Transaction& transaction,
        const std::vector<payment::PaymentCandidate>& candidates) const override;

private:
    DateWindowMatcherConfig config_;
};

} // namespace matching
