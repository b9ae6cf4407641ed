#pragma once

#include "Diagnostics.hpp"
#include "IMatcherStrategy.hpp"
#include "MatcherConfig.hpp"
#include "processing/IFuzzyMatcher.hpp"

#include <memory>

namespace matching
{

/**
 * @brief Approximate text similarity between statement text and invoice text.
 *
 * Transaction fields (description, reference, counterparty, memo) are scored
 * against the candidate's description and counterparty name. The best field
 * similarity (0-100) maps to a confidence between 0.70 and 0.95; candidates
 * below the minimum similarity are dropped.
 *
 * Candidates are pre-filtered by date window and amount tolerance before any
 * string comparison, which keeps the cost proportional to the plausible set.
 */
class FuzzyStringMatcher : public IMatcherStrategy
{
public:
    FuzzyStringMatcher();
    explicit FuzzyStringMatcher(FuzzyMatcherConfig config,
                                std::shared_ptr<const processing::IFuzzyMatcher> similarity = nullptr,
                                Diagnostics diagnostics = Diagnostics());
    ~FuzzyStringMatcher() override;

    [[nodiscard]] std::string name() const override { return "fuzzy"; }

    [[nodiscard]] std::vector<payment::MatchResult> match(
        const payment::Transaction& transaction,
        const std::vector<payment::PaymentCandidate>& candidates) const override;

private:
    struct FieldScore
    {
        std::string field;
        double similarity;
    };

    [[nodiscard]] bool passesPrefilter(const payment::Transaction& transaction,
                                       const payment::PaymentCandidate& candidate) const;
    [[nodiscard]] std::vector<FieldScore> scoreFields(const payment::Transaction& transaction,
                                                      const std::vector<std::string>& candidate_texts) const;

    FuzzyMatcherConfig config_;
    std::shared_ptr<const processing::IFuzzyMatcher> similarity_;
    Diagnostics diagnostics_;
};

/// Candidate description and counterparty name, whichever are present and non-empty.
[[nodiscard]] std::vector<std::string> candidateTexts(const payment::PaymentCandidate& candidate);

} // namespace matching
