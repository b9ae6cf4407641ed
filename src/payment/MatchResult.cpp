#include "MatchResult.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace payment
{

std::string_view toString(MatchType type)
{
    switch (type)
    {
    case MatchType::Exact:
        return "exact";
    case MatchType::Fuzzy:
        return "fuzzy";
    case MatchType::Iban:
        return "iban";
    case MatchType::DateWindow:
        return "date-window";
    case MatchType::Composite:
        return "composite";
    }
    return "composite";
}

bool Confidence::isValid(double value) noexcept
{
    return !std::isnan(value) && value >= 0.0 && value <= 1.0;
}

Confidence::Confidence(double value) : value_(value)
{
    if (!isValid(value))
    {
        throw std::out_of_range("Confidence must be between 0.0 and 1.0, got " + std::to_string(value));
    }
}

MatchResult::MatchResult(const Transaction& transaction, const PaymentCandidate& candidate, Confidence confidence,
                         MatchType type, std::string reason, std::vector<std::string> matched_fields)
    : transaction_(&transaction)
    , candidate_(&candidate)
    , confidence_(confidence)
    , type_(type)
    , reason_(std::move(reason))
    , matched_fields_(std::move(matched_fields))
    , amount_diff_(amountDifference(transaction, candidate))
{
}

void MatchResult::setConfidence(double value)
{
    confidence_ = Confidence(value);
}

bool MatchResult::hasField(std::string_view field) const
{
    return std::find(matched_fields_.begin(), matched_fields_.end(), field) != matched_fields_.end();
}

} // namespace payment
