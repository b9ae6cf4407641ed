#pragma once

#include "Diagnostics.hpp"
#include "IMatcherStrategy.hpp"
#include "MatcherConfig.hpp"

#include <set>
#include <string>

namespace matching
{

/**
 * @brief Structured identifier match on IBANs.
 *
 * IBAN-shaped substrings of any cataloged country are extracted from the
 * transaction's reference, description and memo, and the structured
 * counterparty IBAN is taken as is. A candidate whose own IBAN is among them
 * starts at 0.90; when only the last four digits of its IBAN appear in the
 * text (and partial matching is enabled) it starts at 0.75. Exact or close
 * amount and date add small boosts up to a 0.95 ceiling.
 */
class IbanMatcher : public IMatcherStrategy
{
public:
    static constexpr int kFullMatchBase = 90; // hundredths
    static constexpr int kPartialMatchBase = 75;
    static constexpr int kCeiling = 95;

    IbanMatcher();
    explicit IbanMatcher(IbanMatcherConfig config, Diagnostics diagnostics = Diagnostics());

    [[nodiscard]] std::string name() const override { return "iban"; }

    [[nodiscard]] std::vector<payment::MatchResult> match(
        const payment::Transaction& transaction,
        const std::vector<payment::PaymentCandidate>& candidates) const override;

    /// Normalized, length-validated IBANs found in the transaction.
    [[nodiscard]] static std::set<std::string> extractIbans(const payment::Transaction& transaction);

    /// Every IBAN-shaped substring of text, normalized (not length-validated).
    [[nodiscard]] static std::vector<std::string> findIbans(const std::string& text);

private:
    [[nodiscard]] int confidenceHundredths(const payment::Transaction& transaction,
                                           const payment::PaymentCandidate& candidate, int base) const;

    IbanMatcherConfig config_;
    Diagnostics diagnostics_;
};

} // namespace matching
