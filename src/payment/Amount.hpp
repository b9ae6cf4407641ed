#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace payment
{

/**
 * @brief Exact fixed-point monetary amount.
 *
 * Stores a signed count of ten-thousandths so that "100.0", "100.00" and
 * "100.000" compare equal and one-cent tolerances are integer comparisons.
 */
class Amount
{
public:
    static constexpr std::int64_t kScale = 10000;

    constexpr Amount() = default;

    [[nodiscard]] static constexpr Amount fromUnits(std::int64_t units) { return Amount(units); }
    [[nodiscard]] static constexpr Amount fromCents(std::int64_t cents) { return Amount(cents * (kScale / 100)); }

    /// Parses decimal text ("-1234.56", "100", "0.5"). At most four fractional digits.
    [[nodiscard]] static std::optional<Amount> parse(std::string_view text);

    [[nodiscard]] static constexpr Amount oneCent() { return fromCents(1); }

    [[nodiscard]] constexpr std::int64_t units() const { return units_; }
    [[nodiscard]] constexpr bool isZero() const { return units_ == 0; }
    [[nodiscard]] constexpr bool isNegative() const { return units_ < 0; }
    [[nodiscard]] constexpr Amount abs() const { return Amount(units_ < 0 ? -units_ : units_); }

    /// |this| <= pct % of |base|, compared exactly in decimal. Zero is always within;
    /// any other amount is outside a zero base.
    [[nodiscard]] bool isWithinPercentOf(const Amount& base, double pct) const;

    [[nodiscard]] double toDouble() const { return static_cast<double>(units_) / kScale; }

    /// Two fractional digits, rounded half away from zero ("1234.56").
    [[nodiscard]] std::string toString() const;

    constexpr Amount operator+(const Amount& o) const { return Amount(units_ + o.units_); }
    constexpr Amount operator-(const Amount& o) const { return Amount(units_ - o.units_); }
    constexpr Amount operator-() const { return Amount(-units_); }

    auto operator<=>(const Amount& other) const = default;

private:
    constexpr explicit Amount(std::int64_t units) : units_(units) {}

    std::int64_t units_ = 0;
};

/// |a - b| without intermediate sign handling by callers.
[[nodiscard]] inline Amount absoluteDifference(const Amount& a, const Amount& b) { return (a - b).abs(); }

} // namespace payment
