#pragma once

#include "PaymentTypes.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace payment
{

/**
 * @brief Which kind of evidence produced a match.
 */
enum class MatchType
{
    Exact,
    Fuzzy,
    Iban,
    DateWindow,
    Composite
};

/// "exact", "fuzzy", "iban", "date-window", "composite"
[[nodiscard]] std::string_view toString(MatchType type);

/**
 * @brief Match confidence in the closed interval [0.0, 1.0].
 *
 * A Confidence cannot hold an out-of-range value: the constructor throws
 * std::out_of_range for values outside the interval and for NaN.
 */
class Confidence
{
public:
    explicit Confidence(double value);

    [[nodiscard]] double value() const noexcept { return value_; }

    [[nodiscard]] static bool isValid(double value) noexcept;

    bool operator==(const Confidence& other) const = default;

private:
    double value_;
};

/**
 * @brief One candidate payment proposed for a transaction.
 *
 * Holds back references to the transaction and candidate it was computed
 * from. Both must outlive the result.
 */
class MatchResult
{
public:
    MatchResult(const Transaction& transaction, const PaymentCandidate& candidate, Confidence confidence,
                MatchType type, std::string reason, std::vector<std::string> matched_fields);

    [[nodiscard]] const Transaction& transaction() const { return *transaction_; }
    [[nodiscard]] const PaymentCandidate& candidate() const { return *candidate_; }
    [[nodiscard]] std::uint64_t candidateId() const { return candidate_->id; }

    [[nodiscard]] double confidence() const { return confidence_.value(); }
    /// Throws std::out_of_range when value is outside [0, 1]; the result is left unchanged.
    void setConfidence(double value);

    [[nodiscard]] MatchType type() const { return type_; }
    void setType(MatchType type) { type_ = type; }

    [[nodiscard]] const std::string& reason() const { return reason_; }
    void setReason(std::string reason) { reason_ = std::move(reason); }

    [[nodiscard]] const std::vector<std::string>& matchedFields() const { return matched_fields_; }
    [[nodiscard]] bool hasField(std::string_view field) const;

    [[nodiscard]] const Amount& amountDiff() const { return amount_diff_; }

    // Name of the strategy that produced this result (set by the orchestrator)
    [[nodiscard]] const std::string& strategy() const { return strategy_; }
    void setStrategy(std::string name) { strategy_ = std::move(name); }

private:
    const Transaction* transaction_;
    const PaymentCandidate* candidate_;
    Confidence confidence_;
    MatchType type_;
    std::string reason_;
    std::vector<std::string> matched_fields_;
    Amount amount_diff_;
    std::string strategy_;
};

} // namespace payment
