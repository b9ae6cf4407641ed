#pragma once

#include "payment/MatchResult.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace matching
{

struct StrategyOutcome;

/**
 * @brief Per-strategy counters for one composite matcher.
 *
 * Fed once per strategy evaluation with its duration and result confidences.
 * Confidence buckets are inclusive upper bounds; a confidence lands in the
 * first bucket whose bound it does not exceed.
 */
class MatchingMetrics
{
public:
    static constexpr std::size_t kBucketCount = 9;
    static constexpr std::array<double, kBucketCount> kConfidenceBounds = {0.5, 0.6, 0.7, 0.75, 0.8, 0.85, 0.9, 0.95, 1.0};

    struct StrategyStats
    {
        std::uint64_t runs = 0;
        std::uint64_t failures = 0;
        std::uint64_t results = 0;
        std::chrono::microseconds total_duration{0};
        std::chrono::microseconds max_duration{0};
        std::array<std::uint64_t, kBucketCount> confidence_buckets{};

        [[nodiscard]] std::chrono::microseconds averageDuration() const;
    };

    MatchingMetrics() = default;

    MatchingMetrics(const MatchingMetrics&) = delete;
    MatchingMetrics& operator=(const MatchingMetrics&) = delete;

    void record(const StrategyOutcome& outcome);
    void record(const std::string& strategy, std::chrono::microseconds duration,
                const std::vector<payment::MatchResult>& results, bool succeeded = true);

    [[nodiscard]] std::map<std::string, StrategyStats> snapshot() const;
    [[nodiscard]] StrategyStats statsFor(const std::string& strategy) const;
    void reset();

    /// {"<strategy>": {"runs", "failures", "results", "total_duration_us", "avg_duration_us",
    ///                 "max_duration_us", "confidence_buckets": {"0.5": n, ...}}}
    [[nodiscard]] nlohmann::json toJson() const;

    [[nodiscard]] static std::size_t bucketIndex(double confidence);

private:
    mutable std::mutex mutex_;
    std::map<std::string, StrategyStats> stats_;
};

} // namespace matching
