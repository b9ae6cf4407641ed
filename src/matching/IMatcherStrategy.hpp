#pragma once

#include "payment/MatchResult.hpp"
#include "payment/PaymentTypes.hpp"

#include <string>
#include <vector>

namespace matching
{

/**
 * @brief A single matching heuristic.
 *
 * Implementations are stateless with respect to match(): they read the
 * transaction and candidates, and return a fresh result list sorted by
 * confidence (highest first, input order on ties). The composite matcher
 * runs several strategies concurrently on the same inputs, so match() must
 * not touch shared mutable state.
 */
class IMatcherStrategy
{
public:
    virtual ~IMatcherStrategy() = default;

    // Stable identifier used in logs, audit records and configuration ("exact", "fuzzy", ...)
    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual std::vector<payment::MatchResult> match(
        const payment::Transaction& transaction,
        const std::vector<payment::PaymentCandidate>& candidates) const = 0;
};

} // namespace matching
