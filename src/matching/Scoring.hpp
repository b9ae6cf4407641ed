#pragma once

#include "payment/PaymentTypes.hpp"

#include <optional>

namespace matching
{

// Step scorers shared by the date-window and composite matchers.
// Thresholds are part of the matching contract; change them only together with the tests.

/// 1.0 (<= 0.01), 0.95 (<= 1 %), 0.85 (<= 5 %), 0.70 (<= 10 %), else 0.0.
/// The relative difference is taken against the candidate's matching amount; zero scores 0.0.
[[nodiscard]] double amountScore(const payment::Transaction& tx, const payment::PaymentCandidate& candidate);

/// 1.0 (same day), 0.95 (<= 1), 0.85 (<= 3), 0.70 (<= 7), 0.50 (<= 14), else 0.0.
[[nodiscard]] double dateScore(const payment::Transaction& tx, const payment::PaymentCandidate& candidate);

/// Similarity (0-100) to description score used by the weighted composite:
/// >= 95 -> 1.0, >= 85 -> 0.85, >= 75 -> 0.70, >= 60 -> 0.50, else 0.0.
[[nodiscard]] double descriptionScore(double similarity);

/// Similarity (0-100) to fuzzy confidence: >= 95 -> 0.95 ... >= 75 -> 0.75, else 0.70.
[[nodiscard]] double similarityToConfidence(double similarity);

/// True when the due date lies within +/- window_days of the transaction date.
/// std::nullopt means unrestricted.
[[nodiscard]] bool withinDateWindow(const payment::Transaction& tx, const payment::PaymentCandidate& candidate,
                                    std::optional<int> window_days);

/// |abs(tx) - matching amount| <= 0.01, exact decimal comparison.
[[nodiscard]] bool isExactAmount(const payment::Transaction& tx, const payment::PaymentCandidate& candidate);

/// |abs(tx) - matching amount| <= tolerance_pct % of the matching amount.
[[nodiscard]] bool withinAmountTolerance(const payment::Transaction& tx, const payment::PaymentCandidate& candidate,
                                         double tolerance_pct);

} // namespace matching
