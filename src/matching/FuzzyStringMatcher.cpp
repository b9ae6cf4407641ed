#include "FuzzyStringMatcher.hpp"
#include "Diagnostics.hpp"
#include "Scoring.hpp"
#include "processing/RapidFuzzMatcher.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <plog/Log.h>

namespace matching
{

std::vector<std::string> candidateTexts(const payment::PaymentCandidate& candidate)
{
    std::vector<std::string> texts;
    if (candidate.description && !candidate.description->empty())
        texts.push_back(*candidate.description);
    if (candidate.counterparty_name && !candidate.counterparty_name->empty())
        texts.push_back(*candidate.counterparty_name);
    return texts;
}

FuzzyStringMatcher::FuzzyStringMatcher() : FuzzyStringMatcher(FuzzyMatcherConfig{})
{
}

FuzzyStringMatcher::FuzzyStringMatcher(FuzzyMatcherConfig config,
                                       std::shared_ptr<const processing::IFuzzyMatcher> similarity,
                                       Diagnostics diagnostics)
    : config_(config)
    , similarity_(std::move(similarity))
    , diagnostics_(diagnostics)
{
    if (auto err = config_.validate())
        throw ConfigurationError(*err);

    if (!similarity_)
        similarity_ = std::make_shared<processing::RapidFuzzMatcher>();
}

FuzzyStringMatcher::~FuzzyStringMatcher() = default;

std::vector<payment::MatchResult> FuzzyStringMatcher::match(
    const payment::Transaction& transaction, const std::vector<payment::PaymentCandidate>& candidates) const
{
    std::vector<payment::MatchResult> results;

    for (const auto& candidate : candidates)
    {
        if (!passesPrefilter(transaction, candidate))
            continue;

        const auto texts = candidateTexts(candidate);
        if (texts.empty())
            continue;

        const auto scores = scoreFields(transaction, texts);
        if (scores.empty())
            continue;

        // First field wins ties so the reason is stable
        auto best = scores.begin();
        for (auto it = scores.begin(); it != scores.end(); ++it)
        {
            if (it->similarity > best->similarity)
                best = it;
        }

        if (best->similarity < config_.min_similarity)
            continue;

        std::vector<std::string> fields;
        for (const auto& score : scores)
        {
            if (score.similarity >= config_.min_similarity)
                fields.push_back(score.field);
        }

        std::ostringstream reason;
        reason << "Fuzzy match: " << best->field << " similarity " << std::fixed << std::setprecision(1)
               << best->similarity << "% (" << toString(config_.algorithm) << ")";

        if (diagnostics_.verbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "fuzzy " << diagnostics_.describe(candidate) << " vs "
                                                   << diagnostics_.describe(transaction) << ": " << reason.str();
        }

        results.emplace_back(transaction, candidate, payment::Confidence(similarityToConfidence(best->similarity)),
                             payment::MatchType::Fuzzy, reason.str(), std::move(fields));
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const payment::MatchResult& a, const payment::MatchResult& b)
                     { return a.confidence() > b.confidence(); });
    return results;
}

bool FuzzyStringMatcher::passesPrefilter(const payment::Transaction& transaction,
                                         const payment::PaymentCandidate& candidate) const
{
    return withinDateWindow(transaction, candidate, config_.date_tolerance_days) &&
           withinAmountTolerance(transaction, candidate, config_.amount_tolerance_pct);
}

std::vector<FuzzyStringMatcher::FieldScore> FuzzyStringMatcher::scoreFields(
    const payment::Transaction& transaction, const std::vector<std::string>& candidate_texts) const
{
    std::vector<FieldScore> scores;

    auto score = [&](const std::string& field, const std::string& text, processing::MatchAlgorithm algorithm)
    {
        if (text.empty())
            return;
        if (auto best = similarity_->findBestMatch(text, candidate_texts, 0.0, algorithm))
            scores.push_back({field, best->score});
    };

    score("description", transaction.description, config_.algorithm);
    if (transaction.reference)
        score("reference", *transaction.reference, config_.algorithm);
    if (transaction.counterparty)
        score("counterparty", *transaction.counterparty, config_.algorithm);
    if (transaction.memo)
        score("memo", *transaction.memo, config_.algorithm);

    // References often carry the invoice number inside longer text
    if (transaction.reference)
        score("partial_reference", *transaction.reference, processing::MatchAlgorithm::PartialRatio);

    return scores;
}

} // namespace matching
