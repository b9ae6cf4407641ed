#pragma once

#include "ITextNormalizer.hpp"

namespace processing
{

/**
 * @brief Normalizer for bank statement and invoice text.
 *
 * "BONIFICO  Müller, S.r.l." becomes "bonifico muller srl": case folded,
 * accents removed, punctuation dropped and whitespace collapsed. Uses
 * utf8proc so that non-ASCII letters survive folding.
 */
class PaymentTextNormalizer : public ITextNormalizer
{
public:
    PaymentTextNormalizer() = default;
    ~PaymentTextNormalizer() override = default;

    [[nodiscard]] std::string foldCase(const std::string& text) const override;
    [[nodiscard]] std::string stripPunctuation(const std::string& text) const override;
    [[nodiscard]] std::string collapseWhitespace(const std::string& text) const override;
    [[nodiscard]] std::string normalize(const std::string& text) const override;
};

} // namespace processing
