#pragma once

#include "payment/PaymentTypes.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace matching
{

// Per-matcher trace settings and the plog instance matching traces go to.
// Each matcher holds its own copy, so two composites built from different
// configurations never change each other's verbosity.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;
    static constexpr std::size_t kDefaultPreview = 80;

    Diagnostics() = default;
    explicit Diagnostics(bool verbose, std::size_t max_preview = kDefaultPreview) noexcept;

    [[nodiscard]] bool verbose() const noexcept { return verbose_; }
    [[nodiscard]] std::size_t maxPreview() const noexcept { return max_preview_; }

    // Single-line rendering of statement text, cut at a UTF-8 code point boundary
    [[nodiscard]] std::string preview(std::string_view text) const;

    // "tx-1 100.00 on 2025-03-01 "BONIFICO ..."" for trace lines
    [[nodiscard]] std::string describe(const payment::Transaction& transaction) const;

    // "#12 due 100.00 on 2025-03-01 "Fattura 12/2025""
    [[nodiscard]] std::string describe(const payment::PaymentCandidate& candidate) const;

private:
    bool verbose_ = false;
    std::size_t max_preview_ = kDefaultPreview;
};

} // namespace matching
