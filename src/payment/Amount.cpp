#include "Amount.hpp"

#include <cctype>
#include <cmath>
#include <limits>

namespace payment
{

std::optional<Amount> Amount::parse(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);

    if (text.empty())
        return std::nullopt;

    bool negative = false;
    if (text.front() == '-' || text.front() == '+')
    {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

    std::int64_t whole = 0;
    std::int64_t fraction = 0;
    int fraction_digits = 0;
    bool seen_point = false;
    bool seen_digit = false;

    for (char c : text)
    {
        if (c == '.')
        {
            if (seen_point)
                return std::nullopt;
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;

        seen_digit = true;
        int digit = c - '0';
        if (seen_point)
        {
            if (++fraction_digits > 4)
                return std::nullopt;
            fraction = fraction * 10 + digit;
        }
        else
        {
            if (whole > (kMax - digit) / 10)
                return std::nullopt;
            whole = whole * 10 + digit;
        }
    }

    if (!seen_digit)
        return std::nullopt;

    for (int i = fraction_digits; i < 4; ++i)
        fraction *= 10;

    // whole * kScale + fraction must fit, negated as well.
    if (whole > (kMax - fraction) / kScale)
        return std::nullopt;

    std::int64_t units = whole * kScale + fraction;
    return Amount(negative ? -units : units);
}

bool Amount::isWithinPercentOf(const Amount& base, double pct) const
{
    if (units_ == 0)
        return true;
    if (base.units_ == 0 || !(pct >= 0.0))
        return false;

    // Percent in ten-thousandths, so 7 and 7.25 compare exactly against decimal amounts.
    constexpr double kPctScale = 10000.0;
    constexpr double kPctLimit = 1e12;
    if (pct > kPctLimit)
        return true;
    const auto pct_units = static_cast<__int128>(std::llround(pct * kPctScale));

    const auto diff = static_cast<__int128>(abs().units_);
    const auto denominator = static_cast<__int128>(base.abs().units_);
    return diff * 100 * static_cast<__int128>(kPctScale) <= pct_units * denominator;
}

std::string Amount::toString() const
{
    std::int64_t magnitude = units_ < 0 ? -units_ : units_;
    // Round to cents.
    std::int64_t cents = (magnitude + (kScale / 200)) / (kScale / 100);

    std::string out;
    if (units_ < 0 && cents != 0)
        out.push_back('-');
    out += std::to_string(cents / 100);
    out.push_back('.');
    std::int64_t rem = cents % 100;
    if (rem < 10)
        out.push_back('0');
    out += std::to_string(rem);
    return out;
}

} // namespace payment
