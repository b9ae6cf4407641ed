#include "RapidFuzzMatcher.hpp"
#include "PaymentTextNormalizer.hpp"
#include <rapidfuzz/fuzz.hpp>

namespace processing
{

RapidFuzzMatcher::RapidFuzzMatcher() : normalizer_(std::make_unique<PaymentTextNormalizer>())
{
}

RapidFuzzMatcher::RapidFuzzMatcher(std::unique_ptr<ITextNormalizer> normalizer) : normalizer_(std::move(normalizer))
{
    if (!normalizer_)
    {
        normalizer_ = std::make_unique<PaymentTextNormalizer>();
    }
}

RapidFuzzMatcher::~RapidFuzzMatcher() = default;

std::optional<SimilarityMatch> RapidFuzzMatcher::findBestMatch(const std::string& query,
                                                               const std::vector<std::string>& candidates,
                                                               double threshold, MatchAlgorithm algorithm) const
{
    if (candidates.empty() || query.empty())
    {
        return std::nullopt;
    }

    // Normalize query once
    std::string normalized_query = normalizer_->normalize(query);
    if (normalized_query.empty())
    {
        return std::nullopt;
    }

    std::optional<SimilarityMatch> best;

    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        const auto& candidate = candidates[i];
        if (candidate.empty())
        {
            continue;
        }

        std::string normalized_candidate = normalizer_->normalize(candidate);
        if (normalized_candidate.empty())
        {
            continue;
        }

        double score = callRapidfuzzAlgorithm(normalized_query, normalized_candidate, algorithm);

        // Strictly greater keeps the earliest candidate on ties
        if (score >= threshold && (!best || score > best->score))
        {
            best = SimilarityMatch{score, i, algorithm};
        }
    }

    return best;
}

double RapidFuzzMatcher::similarity(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const
{
    if (s1.empty() || s2.empty())
    {
        return 0.0;
    }

    std::string normalized_s1 = normalizer_->normalize(s1);
    std::string normalized_s2 = normalizer_->normalize(s2);
    if (normalized_s1.empty() || normalized_s2.empty())
    {
        return 0.0;
    }

    return callRapidfuzzAlgorithm(normalized_s1, normalized_s2, algorithm);
}

double RapidFuzzMatcher::callRapidfuzzAlgorithm(const std::string& s1, const std::string& s2,
                                                MatchAlgorithm algorithm) const
{
    switch (algorithm)
    {
    case MatchAlgorithm::Ratio:
        return rapidfuzz::fuzz::ratio(s1, s2);

    case MatchAlgorithm::PartialRatio:
        return rapidfuzz::fuzz::partial_ratio(s1, s2);

    case MatchAlgorithm::TokenSortRatio:
        return rapidfuzz::fuzz::token_sort_ratio(s1, s2);

    case MatchAlgorithm::TokenSetRatio:
        return rapidfuzz::fuzz::token_set_ratio(s1, s2);
    }

    // Fallback to simple ratio
    return rapidfuzz::fuzz::ratio(s1, s2);
}

} // namespace processing
