// Copyright 2017 Alexander Bolz
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include "parse_double.h"

#include "decimal_to_double.h"
#include "ieee.h"

#include <climits>
#include <cstdint>

using bytenum::DecodeCursor;
using bytenum::DecodeResult;
using bytenum::DecodeStatus;
using bytenum::Double;
using bytenum::FormattingData;
using bytenum::ParseResult;
using bytenum::ParseStatus;
using bytenum::Symbol;

static constexpr int NoSymbol = -1;

// Exponents larger than this are clamped. Avoids overflow in integer arithmetic.
static constexpr int MaxExponent = INT_MAX / 4;

static inline bool IsDigitSymbol(int symbol)
{
    return static_cast<unsigned>(symbol) <= 9u;
}

static inline bool Is(int symbol, Symbol s)
{
    return symbol == static_cast<int>(s);
}

// Reads the digit or symbol starting at buffer[pos].
// Returns its id and moves 'pos' past its byte sequence, or returns NoSymbol and leaves 'pos'
// unchanged.
static int ReadSymbol(const FormattingData& formatting, const uint8_t* buffer, int length, int& pos)
{
    DecodeCursor cursor;

    for (int p = pos; p < length; ++p)
    {
        const int fed = cursor.depth + 1;

        const DecodeResult res = formatting.Feed(cursor, buffer[p]);
        if (res.status == DecodeStatus::need_more)
            continue;
        if (res.status == DecodeStatus::invalid)
            return NoSymbol;

        // If the sequence was already unique, its trailing bytes have not been examined yet.
        if (res.length > fed && !formatting.Verify(buffer, length, p + 1, res.symbol, fed))
            return NoSymbol;

        pos += res.length;
        return res.symbol;
    }

    // The input ends within a byte sequence.
    if (cursor.AtStart())
        return NoSymbol;

    const DecodeResult res = formatting.Finish(cursor);
    if (res.status != DecodeStatus::matched)
        return NoSymbol;

    pos += res.length;
    return res.symbol;
}

static inline ParseResult Fail(ParseStatus status, double& value)
{
    value = 0.0;
    return {0, status};
}

ParseResult bytenum::ParseDouble(const uint8_t* buffer, int length, int index, const FormattingData& formatting, double& value)
{
    if (buffer == nullptr || length < 1 || index < 0 || index >= length)
        return Fail(ParseStatus::invalid_input, value);

    char digits[DecimalToDoubleMaxDigits];
    int  num_digits = 0;
    int  scale      = 0; // position of the decimal point relative to digits[0]
    bool is_neg     = false;
    bool has_digits = false;

    int pos  = index; // end of the accepted input
    int next = pos;
    int symbol = ReadSymbol(formatting, buffer, length, next);

    if (Is(symbol, Symbol::nan))
    {
        value = Double(Double::QuietNaNBits).Value();
        return {next - index, ParseStatus::success};
    }

    if (Is(symbol, Symbol::minus_sign) || Is(symbol, Symbol::plus_sign))
    {
        is_neg = Is(symbol, Symbol::minus_sign);
        pos = next;
        symbol = ReadSymbol(formatting, buffer, length, next);
    }

    if (Is(symbol, Symbol::infinity))
    {
        value = Double(Double::InfinityBits | (is_neg ? Double::SignMask : 0)).Value();
        return {next - index, ParseStatus::success};
    }

    // Integer part.
    // Leading zeros are not significant. Digits which do not fit into the buffer only move
    // the decimal point.
    while (IsDigitSymbol(symbol))
    {
        has_digits = true;
        if (num_digits > 0 || symbol != 0)
        {
            if (num_digits < DecimalToDoubleMaxDigits)
                digits[num_digits++] = static_cast<char>('0' + symbol);
            ++scale;
        }
        pos = next;
        symbol = ReadSymbol(formatting, buffer, length, next);
    }

    // Fractional part.
    if (Is(symbol, Symbol::decimal_separator))
    {
        const int separator_end = next;
        symbol = ReadSymbol(formatting, buffer, length, next);

        if (has_digits || IsDigitSymbol(symbol))
            pos = separator_end;

        while (IsDigitSymbol(symbol))
        {
            has_digits = true;
            if (num_digits == 0 && symbol == 0)
            {
                // Move this 0 into the scale.
                --scale;
            }
            else if (num_digits < DecimalToDoubleMaxDigits)
            {
                digits[num_digits++] = static_cast<char>('0' + symbol);
            }
            pos = next;
            symbol = ReadSymbol(formatting, buffer, length, next);
        }
    }

    if (!has_digits)
        return Fail(ParseStatus::no_digits, value);

    // Exponent.
    if (Is(symbol, Symbol::exponent) || Is(symbol, Symbol::exponent_secondary))
    {
        symbol = ReadSymbol(formatting, buffer, length, next);

        const bool exp_is_neg = Is(symbol, Symbol::minus_sign);
        if (exp_is_neg || Is(symbol, Symbol::plus_sign))
        {
            symbol = ReadSymbol(formatting, buffer, length, next);
        }

        if (!IsDigitSymbol(symbol))
            return Fail(ParseStatus::syntax_error, value);

        int num = 0;
        while (IsDigitSymbol(symbol))
        {
            if (num <= MaxExponent / 10 - 9)
                num = 10 * num + symbol;
            else
                num = MaxExponent;
            pos = next;
            symbol = ReadSymbol(formatting, buffer, length, next);
        }

        const int64_t e = int64_t{scale} + (exp_is_neg ? -num : num);
        scale = e > MaxExponent ? MaxExponent : (e < -MaxExponent ? -MaxExponent : static_cast<int>(e));
    }

    const DecimalToDoubleResult res = DecimalToDouble(digits, num_digits, scale, is_neg);
    if (!res)
        return Fail(ParseStatus::syntax_error, value);

    value = res.value;
    return {pos - index, ParseStatus::success};
}
