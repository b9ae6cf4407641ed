#include "IbanMatcher.hpp"
#include "Diagnostics.hpp"
#include "Scoring.hpp"
#include "iban/IbanFormats.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <plog/Log.h>

namespace matching
{

namespace
{

const std::regex& ibanRegex()
{
    static const std::regex re(iban::combinedPattern(), std::regex::ECMAScript | std::regex::icase);
    return re;
}

std::string collectText(const payment::Transaction& tx)
{
    std::string text;
    auto append = [&text](const std::string& part)
    {
        if (part.empty())
            return;
        if (!text.empty())
            text.push_back(' ');
        text += part;
    };

    if (tx.reference)
        append(*tx.reference);
    append(tx.description);
    if (tx.memo)
        append(*tx.memo);

    for (char& c : text)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return text;
}

bool isDigits(std::string_view s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// True when digits occur in text as a group not adjacent to other digits
bool containsDigitGroup(const std::string& text, std::string_view digits)
{
    std::size_t pos = text.find(digits);
    while (pos != std::string::npos)
    {
        const bool left_ok = pos == 0 || !std::isdigit(static_cast<unsigned char>(text[pos - 1]));
        const std::size_t end = pos + digits.size();
        const bool right_ok = end >= text.size() || !std::isdigit(static_cast<unsigned char>(text[end]));
        if (left_ok && right_ok)
            return true;
        pos = text.find(digits, pos + 1);
    }
    return false;
}

std::string maskIban(const std::string& value)
{
    if (value.size() <= 10)
        return value;
    return value.substr(0, 6) + "..." + value.substr(value.size() - 4);
}

} // namespace

IbanMatcher::IbanMatcher() : IbanMatcher(IbanMatcherConfig{})
{
}

IbanMatcher::IbanMatcher(IbanMatcherConfig config, Diagnostics diagnostics)
    : config_(config)
    , diagnostics_(diagnostics)
{
    if (auto err = config_.validate())
        throw ConfigurationError(*err);
}

std::vector<std::string> IbanMatcher::findIbans(const std::string& text)
{
    std::vector<std::string> found;
    if (text.empty())
        return found;

    const auto& re = ibanRegex();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it)
    {
        found.push_back(iban::normalize(it->str()));
    }
    return found;
}

std::set<std::string> IbanMatcher::extractIbans(const payment::Transaction& transaction)
{
    std::set<std::string> ibans;
    auto scan = [&ibans](const std::string& text)
    {
        for (auto& value : findIbans(text))
            ibans.insert(std::move(value));
    };

    if (transaction.reference)
        scan(*transaction.reference);
    scan(transaction.description);
    if (transaction.memo)
        scan(*transaction.memo);
    if (transaction.counterparty_iban)
        ibans.insert(iban::normalize(*transaction.counterparty_iban));

    // Keep only values whose length matches their country's format
    for (auto it = ibans.begin(); it != ibans.end();)
    {
        if (iban::validateLength(*it))
            ++it;
        else
            it = ibans.erase(it);
    }
    return ibans;
}

std::vector<payment::MatchResult> IbanMatcher::match(
    const payment::Transaction& transaction, const std::vector<payment::PaymentCandidate>& candidates) const
{
    std::vector<payment::MatchResult> results;
    if (candidates.empty())
        return results;

    const auto transaction_ibans = extractIbans(transaction);
    const std::string transaction_text = config_.partial_match ? collectText(transaction) : std::string();

    for (const auto& candidate : candidates)
    {
        if (!candidate.iban)
            continue;

        const std::string candidate_iban = iban::normalize(*candidate.iban);
        if (!iban::validateLength(candidate_iban))
            continue;

        const bool full = transaction_ibans.count(candidate_iban) > 0;
        bool partial = false;
        if (!full && config_.partial_match)
        {
            const std::string_view tail = std::string_view(candidate_iban).substr(candidate_iban.size() - 4);
            partial = isDigits(tail) && containsDigitGroup(transaction_text, tail);
        }
        if (!full && !partial)
            continue;

        if (!withinDateWindow(transaction, candidate, config_.date_tolerance_days))
            continue;

        const int hundredths =
            confidenceHundredths(transaction, candidate, full ? kFullMatchBase : kPartialMatchBase);

        const std::string country = iban::countryName(candidate_iban).value_or("Unknown");
        std::string reason;
        if (full)
        {
            reason = "IBAN match (" + country + "): " + maskIban(candidate_iban) + " found in transaction";
        }
        else
        {
            reason = "IBAN partial match (" + country + "): last 4 digits " +
                     candidate_iban.substr(candidate_iban.size() - 4) + " detected in transaction";
        }

        const payment::Amount diff = payment::amountDifference(transaction, candidate);
        if (diff <= payment::Amount::oneCent())
            reason += ", exact amount";
        else
            reason += ", amount diff " + diff.toString();

        const long days = payment::daysBetween(transaction.date, candidate.due_date);
        reason += days == 0 ? std::string(", same date") : ", " + std::to_string(days) + " days apart";

        std::vector<std::string> fields = {"iban"};
        if (partial)
            fields.emplace_back("iban_last4");

        if (diagnostics_.verbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "iban " << diagnostics_.describe(candidate) << ": " << reason;
        }

        results.emplace_back(transaction, candidate, payment::Confidence(hundredths / 100.0), payment::MatchType::Iban,
                             std::move(reason), std::move(fields));
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const payment::MatchResult& a, const payment::MatchResult& b)
                     { return a.confidence() > b.confidence(); });
    return results;
}

int IbanMatcher::confidenceHundredths(const payment::Transaction& transaction,
                                      const payment::PaymentCandidate& candidate, int base) const
{
    int confidence = base;

    if (isExactAmount(transaction, candidate))
        confidence += 5;
    else if (withinAmountTolerance(transaction, candidate, config_.amount_tolerance_pct))
        confidence += 2;

    const long days = payment::daysBetween(transaction.date, candidate.due_date);
    if (days == 0)
        confidence += 5;
    else if (days <= 3)
        confidence += 2;

    return std::min(confidence, kCeiling);
}

} // namespace matching
