#pragma once

#include "MatchResult.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace payment
{

// Audit records for applied or queued matches.

/// {"transaction_id", "candidate_id", "confidence", "match_type", "reason",
///  "matched_fields", "amount_diff", "strategy"}
[[nodiscard]] nlohmann::json toJson(const MatchResult& result);

/// Array of records in ranked order
[[nodiscard]] nlohmann::json toJson(const std::vector<MatchResult>& results);

} // namespace payment
