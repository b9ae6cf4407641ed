#include "PaymentTextNormalizer.hpp"

#include <cctype>
#include <cstdlib>
#include <utf8proc.h>
#include <plog/Log.h>

namespace processing
{

namespace
{

std::string asciiLower(const std::string& text)
{
    std::string out = text;
    for (char& c : out)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

void appendCodepoint(std::string& out, utf8proc_int32_t cp)
{
    utf8proc_uint8_t buffer[4];
    utf8proc_ssize_t bytes = utf8proc_encode_char(cp, buffer);
    if (bytes > 0)
    {
        out.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(bytes));
    }
}

} // namespace

std::string PaymentTextNormalizer::foldCase(const std::string& text) const
{
    if (text.empty())
        return text;

    utf8proc_uint8_t* folded = nullptr;
    const auto options = static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE | UTF8PROC_COMPAT |
                                                        UTF8PROC_CASEFOLD | UTF8PROC_STRIPMARK);
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                                        static_cast<utf8proc_ssize_t>(text.size()), &folded, options);

    if (len < 0 || !folded)
    {
        PLOG_WARNING << "Case folding failed (" << utf8proc_errmsg(len) << "), falling back to ASCII lowercase";
        std::free(folded);
        return asciiLower(text);
    }

    std::string out(reinterpret_cast<char*>(folded), static_cast<std::size_t>(len));
    std::free(folded);
    return out;
}

std::string PaymentTextNormalizer::stripPunctuation(const std::string& text) const
{
    if (text.empty())
        return text;

    std::string out;
    out.reserve(text.size());

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t cp;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &cp);
        if (bytes <= 0)
        {
            // Invalid UTF-8 byte: skip it
            ++pos;
            continue;
        }
        pos += bytes;

        switch (utf8proc_category(cp))
        {
        case UTF8PROC_CATEGORY_LU:
        case UTF8PROC_CATEGORY_LL:
        case UTF8PROC_CATEGORY_LT:
        case UTF8PROC_CATEGORY_LM:
        case UTF8PROC_CATEGORY_LO:
        case UTF8PROC_CATEGORY_ND:
        case UTF8PROC_CATEGORY_NL:
        case UTF8PROC_CATEGORY_NO:
            appendCodepoint(out, cp);
            break;
        case UTF8PROC_CATEGORY_ZS:
        case UTF8PROC_CATEGORY_ZL:
        case UTF8PROC_CATEGORY_ZP:
            out.push_back(' ');
            break;
        case UTF8PROC_CATEGORY_CC:
            // Tabs and newlines are control characters in Unicode
            if (cp == '\t' || cp == '\n' || cp == '\r' || cp == '\v' || cp == '\f')
                out.push_back(' ');
            break;
        default:
            break;
        }
    }

    return out;
}

std::string PaymentTextNormalizer::collapseWhitespace(const std::string& text) const
{
    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    for (char c : text)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space)
        {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }

    return result;
}

std::string PaymentTextNormalizer::normalize(const std::string& text) const
{
    if (text.empty())
        return text;

    return collapseWhitespace(stripPunctuation(foldCase(text)));
}

} // namespace processing
