#pragma once

#include <string>

namespace processing
{

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Unicode case folding + compatibility decomposition, diacritics removed
    [[nodiscard]] virtual std::string foldCase(const std::string& text) const = 0;

    // Drops punctuation and symbols, maps any whitespace to a single space character
    [[nodiscard]] virtual std::string stripPunctuation(const std::string& text) const = 0;

    // Collapses whitespace runs to one space and trims both ends
    [[nodiscard]] virtual std::string collapseWhitespace(const std::string& text) const = 0;

    // Full normalization pipeline: fold + strip + collapse
    [[nodiscard]] virtual std::string normalize(const std::string& text) const = 0;
};

} // namespace processing
