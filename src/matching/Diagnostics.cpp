#include "Diagnostics.hpp"

#include <iomanip>
#include <sstream>

namespace matching
{

namespace
{

bool isContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }

std::string isoDate(const payment::Date& date)
{
    std::ostringstream ss;
    ss << static_cast<int>(date.year()) << '-' << std::setfill('0') << std::setw(2)
       << static_cast<unsigned>(date.month()) << '-' << std::setw(2) << static_cast<unsigned>(date.day());
    return ss.str();
}

} // namespace

Diagnostics::Diagnostics(bool verbose, std::size_t max_preview) noexcept
    : verbose_(verbose)
    , max_preview_(max_preview == 0 ? 1 : max_preview)
{
}

std::string Diagnostics::preview(std::string_view text) const
{
    std::size_t cut = text.size();
    if (cut > max_preview_)
    {
        cut = max_preview_;
        while (cut > 0 && isContinuationByte(static_cast<unsigned char>(text[cut])))
            --cut;
    }

    std::string out;
    out.reserve(cut + 24);
    for (std::size_t i = 0; i < cut; ++i)
    {
        const char ch = text[i];
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(static_cast<unsigned char>(ch) < 0x20 ? '?' : ch);
            break;
        }
    }

    if (cut < text.size())
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }
    return out;
}

std::string Diagnostics::describe(const payment::Transaction& transaction) const
{
    return transaction.id + " " + transaction.amount.toString() + " on " + isoDate(transaction.date) + " \"" +
           preview(transaction.description) + "\"";
}

std::string Diagnostics::describe(const payment::PaymentCandidate& candidate) const
{
    std::string out = "#" + std::to_string(candidate.id) + " due " + candidate.matchingAmount().toString() + " on " +
                      isoDate(candidate.due_date);
    if (candidate.description && !candidate.description->empty())
        out += " \"" + preview(*candidate.description) + "\"";
    return out;
}

} // namespace matching
