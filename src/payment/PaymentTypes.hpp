#pragma once

#include "Amount.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace payment
{

using Date = std::chrono::year_month_day;

// Input records for the matching engine. Both are read-only during matching.

// Bank transaction as imported from a statement or entered manually
struct Transaction
{
    std::string id;
    Amount amount;                                 // Signed, positive = incoming
    Date date;
    std::string description;
    std::optional<std::string> reference;          // Remittance information / causale
    std::optional<std::string> memo;               // Free-text note
    std::optional<std::string> counterparty;       // Counterparty name
    std::optional<std::string> counterparty_iban;  // Structured counterparty identifier
};

// Outstanding payment that a transaction may settle
struct PaymentCandidate
{
    std::uint64_t id = 0;
    Amount amount_due;
    std::optional<Amount> amount_paid;             // Already settled part, if any
    Date due_date;
    std::optional<std::string> iban;
    std::optional<std::string> description;        // Linked invoice text
    std::optional<std::string> counterparty_name;  // Client name on the invoice

    /// Outstanding amount used for comparisons: max(0, |due| - |paid|).
    [[nodiscard]] Amount matchingAmount() const
    {
        Amount due = amount_due.abs();
        if (!amount_paid)
            return due;
        Amount outstanding = due - amount_paid->abs();
        return outstanding.isNegative() ? Amount{} : outstanding;
    }
};

/// Absolute number of days between two calendar dates.
[[nodiscard]] inline long daysBetween(const Date& a, const Date& b)
{
    auto diff = (std::chrono::sys_days(a) - std::chrono::sys_days(b)).count();
    return static_cast<long>(diff < 0 ? -diff : diff);
}

/// |abs(tx.amount) - candidate.matchingAmount()|
[[nodiscard]] inline Amount amountDifference(const Transaction& tx, const PaymentCandidate& candidate)
{
    return absoluteDifference(tx.amount.abs(), candidate.matchingAmount());
}

} // namespace payment
