#include "Scoring.hpp"

namespace matching
{

using payment::Amount;

double amountScore(const payment::Transaction& tx, const payment::PaymentCandidate& candidate)
{
    const Amount expected = candidate.matchingAmount();
    if (expected.isZero())
        return 0.0;

    const Amount diff = payment::amountDifference(tx, candidate);
    if (diff <= Amount::oneCent())
        return 1.0;

    if (diff.isWithinPercentOf(expected, 1.0))
        return 0.95;
    if (diff.isWithinPercentOf(expected, 5.0))
        return 0.85;
    if (diff.isWithinPercentOf(expected, 10.0))
        return 0.70;
    return 0.0;
}

double dateScore(const payment::Transaction& tx, const payment::PaymentCandidate& candidate)
{
    const long days = payment::daysBetween(tx.date, candidate.due_date);
    if (days == 0)
        return 1.0;
    if (days <= 1)
        return 0.95;
    if (days <= 3)
        return 0.85;
    if (days <= 7)
        return 0.70;
    if (days <= 14)
        return 0.50;
    return 0.0;
}

double descriptionScore(double similarity)
{
    if (similarity >= 95.0)
        return 1.0;
    if (similarity >= 85.0)
        return 0.85;
    if (similarity >= 75.0)
        return 0.70;
    if (similarity >= 60.0)
        return 0.50;
    return 0.0;
}

double similarityToConfidence(double similarity)
{
    if (similarity >= 95.0)
        return 0.95;
    if (similarity >= 90.0)
        return 0.90;
    if (similarity >= 85.0)
        return 0.85;
    if (similarity >= 80.0)
        return 0.80;
    if (similarity >= 75.0)
        return 0.75;
    return 0.70;
}

bool withinDateWindow(const payment::Transaction& tx, const payment::PaymentCandidate& candidate,
                      std::optional<int> window_days)
{
    if (!window_days)
        return true;
    return payment::daysBetween(tx.date, candidate.due_date) <= *window_days;
}

bool isExactAmount(const payment::Transaction& tx, const payment::PaymentCandidate& candidate)
{
    return payment::amountDifference(tx, candidate) <= Amount::oneCent();
}

bool withinAmountTolerance(const payment::Transaction& tx, const payment::PaymentCandidate& candidate,
                           double tolerance_pct)
{
    return payment::amountDifference(tx, candidate).isWithinPercentOf(candidate.matchingAmount(), tolerance_pct);
}

} // namespace matching
