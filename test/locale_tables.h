#pragma once

#include "catch2/catch.hpp"

#include "formatting_data.h"

#include <cstdint>
#include <string>
#include <vector>

// Code points of the symbols of a table, indexed by symbol id.
// An empty string leaves the symbol undefined.
using LocaleSymbols = std::u32string[bytenum::SymbolCount];

// BMP only.
inline void AppendCodePoint(std::vector<uint8_t>& out, char32_t cp, bytenum::Encoding encoding)
{
    if (encoding == bytenum::Encoding::utf16)
    {
        out.push_back(static_cast<uint8_t>(cp & 0xFF));
        out.push_back(static_cast<uint8_t>(cp >> 8));
        return;
    }

    if (cp < 0x80)
    {
        out.push_back(static_cast<uint8_t>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<uint8_t>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<uint8_t>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<uint8_t>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<uint8_t>(0x80 | (cp & 0x3F)));
    }
}

inline std::vector<uint8_t> Encode(const std::u32string& str, bytenum::Encoding encoding)
{
    std::vector<uint8_t> out;
    for (const char32_t cp : str)
    {
        AppendCodePoint(out, cp, encoding);
    }
    return out;
}

inline bytenum::FormattingData MakeTable(const LocaleSymbols& symbols, bytenum::Encoding encoding)
{
    bytenum::SymbolCodes codes;
    for (int i = 0; i < bytenum::SymbolCount; ++i)
    {
        if (!symbols[i].empty())
            codes[i] = Encode(symbols[i], encoding);
    }

    bytenum::FormattingData fd;
    const bytenum::BuildStatus status = bytenum::FormattingData::Create(codes, encoding, fd);
    REQUIRE(status == bytenum::BuildStatus::ok);
    return fd;
}

// Arabic-Indic digits and separators, U+2212 minus sign, U+221E infinity.
inline bytenum::FormattingData MakeArabic(bytenum::Encoding encoding)
{
    const LocaleSymbols symbols = {
        U"\u0660", U"\u0661", U"\u0662", U"\u0663", U"\u0664",
        U"\u0665", U"\u0666", U"\u0667", U"\u0668", U"\u0669",
        U"\u066B", // decimal separator
        U"\u066C", // group separator
        U"\u221E", // infinity
        U"\u2212", // minus sign
        U"+",
        U"NaN",
        U"E",
        U"e",
    };

    return MakeTable(symbols, encoding);
}

// Concatenates the byte sequences of the given symbols.
inline std::vector<uint8_t> EncodeSymbols(const bytenum::FormattingData& fd, const std::vector<int>& symbols)
{
    std::vector<uint8_t> out;
    for (const int s : symbols)
    {
        const uint8_t* code = fd.Code(s);
        REQUIRE(code != nullptr);
        out.insert(out.end(), code, code + fd.CodeLength(s));
    }
    return out;
}
