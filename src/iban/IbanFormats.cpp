#include "IbanFormats.hpp"

#include <cctype>
#include <map>

namespace iban
{

namespace
{

using Catalog = std::map<std::string, IbanFormat, std::less<>>;

const Catalog& catalog()
{
    static const Catalog formats = []
    {
        Catalog c;
        auto add = [&c](const char* code, const char* name, std::size_t length, const char* pattern,
                        const char* example)
        { c.emplace(code, IbanFormat{code, name, length, pattern, example}); };

        // Southern Europe
        add("IT", "Italy", 27, R"(\d{2}[A-Z]\d{10}[0-9A-Z]{12})", "IT60X0542811101000000123456");
        add("ES", "Spain", 24, R"(\d{22})", "ES9121000418450200051332");
        add("PT", "Portugal", 25, R"(\d{23})", "PT50000201231234567890154");
        add("GR", "Greece", 27, R"(\d{2}\d{3}\d{4}[A-Z0-9]{16})", "GR1601101250000000012300695");
        add("MT", "Malta", 31, R"(\d{2}[A-Z]{4}\d{5}[A-Z0-9]{18})", "MT84MALT011000012345MTLCAST001S");
        add("CY", "Cyprus", 28, R"(\d{2}\d{3}\d{5}[A-Z0-9]{16})", "CY17002001280000001200527600");
        add("SI", "Slovenia", 19, R"(\d{2}\d{5}\d{8}\d{2})", "SI56263300012039086");
        add("HR", "Croatia", 21, R"(\d{19})", "HR1210010051863000160");

        // Western Europe
        add("FR", "France", 27, R"(\d{12}[A-Z0-9]{11}\d{2})", "FR1420041010050500013M02606");
        add("DE", "Germany", 22, R"(\d{20})", "DE89370400440532013000");
        add("NL", "Netherlands", 18, R"(\d{2}[A-Z]{4}\d{10})", "NL91ABNA0417164300");
        add("BE", "Belgium", 16, R"(\d{14})", "BE68539007547034");
        add("LU", "Luxembourg", 20, R"(\d{2}\d{3}[A-Z0-9]{13})", "LU280019400644750000");
        add("AT", "Austria", 20, R"(\d{18})", "AT611904300234573201");
        add("LI", "Liechtenstein", 21, R"(\d{2}\d{5}[A-Z0-9]{12})", "LI21088100002324013AA");

        // Northern Europe
        add("IE", "Ireland", 22, R"(\d{2}[A-Z]{4}\d{14})", "IE29AIBK93115212345678");
        add("DK", "Denmark", 18, R"(\d{16})", "DK5000400440116243");
        add("FI", "Finland", 18, R"(\d{16})", "FI2112345600000785");
        add("SE", "Sweden", 24, R"(\d{22})", "SE4550000000058398257466");
        add("NO", "Norway", 15, R"(\d{13})", "NO9386011117947");
        add("IS", "Iceland", 26, R"(\d{24})", "IS140159260076545510730339");

        // Eastern Europe
        add("PL", "Poland", 28, R"(\d{26})", "PL61109010140000071219812874");
        add("CZ", "Czech Republic", 24, R"(\d{22})", "CZ6508000000192000145399");
        add("SK", "Slovakia", 24, R"(\d{22})", "SK3112000000198742637541");
        add("HU", "Hungary", 28, R"(\d{26})", "HU42117730161111101800000000");
        add("RO", "Romania", 24, R"(\d{2}[A-Z]{4}[A-Z0-9]{16})", "RO49AAAA1B31007593840000");
        add("BG", "Bulgaria", 22, R"(\d{2}[A-Z]{4}\d{14})", "BG80BNBG96611020345678");

        // Baltic states
        add("EE", "Estonia", 20, R"(\d{18})", "EE382200221020145685");
        add("LV", "Latvia", 21, R"(\d{2}[A-Z]{4}[A-Z0-9]{13})", "LV80BANK0000435195001");
        add("LT", "Lithuania", 20, R"(\d{18})", "LT121000011101001000");

        return c;
    }();
    return formats;
}

std::string upperCode(std::string_view text)
{
    std::string code;
    for (std::size_t i = 0; i < 2 && i < text.size(); ++i)
    {
        code.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(text[i]))));
    }
    return code;
}

} // namespace

const IbanFormat* formatFor(std::string_view country_code)
{
    if (country_code.size() != 2)
        return nullptr;

    const auto& formats = catalog();
    auto it = formats.find(upperCode(country_code));
    return it != formats.end() ? &it->second : nullptr;
}

std::optional<std::string> detectCountry(std::string_view iban)
{
    if (iban.size() < 2)
        return std::nullopt;

    if (const IbanFormat* format = formatFor(iban.substr(0, 2)))
        return format->country_code;
    return std::nullopt;
}

bool validateLength(std::string_view iban)
{
    if (iban.size() < 2)
        return false;

    const IbanFormat* format = formatFor(iban.substr(0, 2));
    return format != nullptr && iban.size() == format->length;
}

std::optional<std::string> countryName(std::string_view iban)
{
    if (iban.size() < 2)
        return std::nullopt;

    if (const IbanFormat* format = formatFor(iban.substr(0, 2)))
        return format->country_name;
    return std::nullopt;
}

const std::string& combinedPattern()
{
    static const std::string pattern = []
    {
        std::string out;
        for (const auto& [code, format] : catalog())
        {
            if (!out.empty())
                out.push_back('|');
            out += "(?:" + format.fullPattern() + ")";
        }
        return out;
    }();
    return pattern;
}

std::optional<std::string> exampleFor(std::string_view country_code)
{
    if (const IbanFormat* format = formatFor(country_code))
        return format->example;
    return std::nullopt;
}

std::vector<std::string> supportedCountries()
{
    std::vector<std::string> codes;
    codes.reserve(catalog().size());
    for (const auto& [code, format] : catalog())
    {
        codes.push_back(code);
    }
    // std::map already iterates in sorted key order
    return codes;
}

std::string normalize(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) && uc < 0x80)
            out.push_back(static_cast<char>(std::toupper(uc)));
    }
    return out;
}

} // namespace iban
