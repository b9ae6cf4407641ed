#include "MatchResultJson.hpp"

#include <string>

namespace payment
{

nlohmann::json toJson(const MatchResult& result)
{
    nlohmann::json j;
    j["transaction_id"] = result.transaction().id;
    j["candidate_id"] = result.candidateId();
    j["confidence"] = result.confidence();
    j["match_type"] = std::string(toString(result.type()));
    j["reason"] = result.reason();
    j["matched_fields"] = result.matchedFields();
    j["amount_diff"] = result.amountDiff().toString();
    j["strategy"] = result.strategy();
    return j;
}

nlohmann::json toJson(const std::vector<MatchResult>& results)
{
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& result : results)
    {
        arr.push_back(toJson(result));
    }
    return arr;
}

} // namespace payment
