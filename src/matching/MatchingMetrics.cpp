#include "MatchingMetrics.hpp"
#include "StrategyRunner.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace matching
{

namespace
{

constexpr std::array<const char*, MatchingMetrics::kBucketCount> kBucketNames = {
    "0.5", "0.6", "0.7", "0.75", "0.8", "0.85", "0.9", "0.95", "1.0"};

} // namespace

std::chrono::microseconds MatchingMetrics::StrategyStats::averageDuration() const
{
    if (runs == 0)
        return std::chrono::microseconds{0};
    return std::chrono::microseconds{total_duration.count() / static_cast<std::int64_t>(runs)};
}

std::size_t MatchingMetrics::bucketIndex(double confidence)
{
    for (std::size_t i = 0; i < kConfidenceBounds.size(); ++i)
    {
        if (confidence <= kConfidenceBounds[i])
            return i;
    }
    return kBucketCount - 1;
}

void MatchingMetrics::record(const StrategyOutcome& outcome)
{
    record(outcome.strategy_name, outcome.duration, outcome.results, outcome.succeeded);
}

void MatchingMetrics::record(const std::string& strategy, std::chrono::microseconds duration,
                             const std::vector<payment::MatchResult>& results, bool succeeded)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stats = stats_[strategy];
    ++stats.runs;
    if (!succeeded)
        ++stats.failures;
    stats.total_duration += duration;
    stats.max_duration = std::max(stats.max_duration, duration);
    for (const auto& result : results)
    {
        ++stats.results;
        ++stats.confidence_buckets[bucketIndex(result.confidence())];
    }
}

std::map<std::string, MatchingMetrics::StrategyStats> MatchingMetrics::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

MatchingMetrics::StrategyStats MatchingMetrics::statsFor(const std::string& strategy) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(strategy);
    return it == stats_.end() ? StrategyStats{} : it->second;
}

void MatchingMetrics::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.clear();
}

nlohmann::json MatchingMetrics::toJson() const
{
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, stats] : snapshot())
    {
        nlohmann::json buckets = nlohmann::json::object();
        for (std::size_t i = 0; i < kBucketNames.size(); ++i)
            buckets[kBucketNames[i]] = stats.confidence_buckets[i];

        out[name] = {
            {"runs", stats.runs},
            {"failures", stats.failures},
            {"results", stats.results},
            {"total_duration_us", stats.total_duration.count()},
            {"avg_duration_us", stats.averageDuration().count()},
            {"max_duration_us", stats.max_duration.count()},
            {"confidence_buckets", buckets},
        };
    }
    return out;
}

} // namespace matching
