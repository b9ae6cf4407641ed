#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace processing
{

/**
 * @brief Fuzzy matching algorithms supported by the matcher.
 */
enum class MatchAlgorithm
{
    Ratio,          // Simple Levenshtein-based ratio (general purpose)
    PartialRatio,   // Partial substring matching (e.g., "rossi" matches "bonifico mario rossi")
    TokenSortRatio, // Order-independent token matching (e.g., "mario rossi" matches "rossi mario")
    TokenSetRatio   // Set-based token matching (extra words on either side are tolerated)
};

/**
 * @brief Result of a best-match lookup.
 */
struct SimilarityMatch
{
    double score;              // Similarity on a 0-100 scale
    std::size_t index;         // Position of the matched candidate in the input list
    MatchAlgorithm algorithm;  // The algorithm used for matching
};

/**
 * @brief Abstract interface for fuzzy string matchers.
 *
 * Implementations normalize both sides before scoring, so callers pass raw
 * statement and invoice text.
 */
class IFuzzyMatcher
{
public:
    virtual ~IFuzzyMatcher() = default;

    /**
     * @brief Find the best matching candidate at or above the threshold.
     *
     * @param query The query string to match against candidates
     * @param candidates List of candidate strings to search
     * @param threshold Minimum similarity [0, 100] required for a match
     * @param algorithm The matching algorithm to use (default: Ratio)
     * @return The best match if score >= threshold, otherwise std::nullopt.
     *         On equal scores the earliest candidate wins.
     */
    virtual std::optional<SimilarityMatch> findBestMatch(const std::string& query,
                                                          const std::vector<std::string>& candidates,
                                                          double threshold,
                                                          MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;

    /**
     * @brief Calculate similarity between two strings.
     *
     * @return Similarity on a 0-100 scale; 0 when either side normalizes to empty
     */
    virtual double similarity(const std::string& s1, const std::string& s2,
                              MatchAlgorithm algorithm = MatchAlgorithm::Ratio) const = 0;
};

} // namespace processing
