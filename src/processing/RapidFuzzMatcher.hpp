#pragma once

#include "IFuzzyMatcher.hpp"
#include "ITextNormalizer.hpp"
#include <memory>

namespace processing
{

/**
 * @brief Fuzzy string matcher for payment text backed by rapidfuzz-cpp.
 *
 * This implementation:
 * - Normalizes text with PaymentTextNormalizer (case fold, accents, punctuation)
 * - Wraps rapidfuzz-cpp algorithms for efficient string matching
 * - Reports scores on rapidfuzz's native 0-100 scale
 *
 * Example:
 * @code
 * RapidFuzzMatcher matcher;
 * double score = matcher.similarity("ROSSI MARIO S.R.L.", "Rossi Mario srl"); // 100
 * @endcode
 */
class RapidFuzzMatcher : public IFuzzyMatcher
{
public:
    RapidFuzzMatcher();
    explicit RapidFuzzMatcher(std::unique_ptr<ITextNormalizer> normalizer);
    ~RapidFuzzMatcher() override;

    std::optional<SimilarityMatch> findBestMatch(const std::string& query, const std::vector<std::string>& candidates,
                                                  double threshold,
                                                  MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

    double similarity(const std::string& s1, const std::string& s2,
                      MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const override;

private:
    std::unique_ptr<ITextNormalizer> normalizer_;

    double callRapidfuzzAlgorithm(const std::string& s1, const std::string& s2, MatchAlgorithm algorithm) const;
};

} // namespace processing
