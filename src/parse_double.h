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

#pragma once

#include "formatting_data.h"

#include <cstdint>

namespace bytenum {

enum class ParseStatus {
    success,
    invalid_input, // empty buffer or index out of range
    no_digits,
    syntax_error,
};

struct ParseResult
{
    int bytes_consumed;
    ParseStatus status;

    // Test for success.
    explicit operator bool() const noexcept
    {
        return status == ParseStatus::success;
    }
};

// ParseResult res = ParseDouble(buffer, length, index, formatting, value);
//
// Parses a floating-point number starting at buffer[index]. The digits and symbols are
// recognized using the byte sequences of 'formatting'. The accepted syntax is
//
//      nan
//      [minus | plus] infinity
//      [minus | plus] digits [decimal_separator [digits]] [exponent [minus | plus] digits]
//      [minus | plus] decimal_separator digits [exponent [minus | plus] digits]
//
// where 'exponent' is either of the two exponent symbols. Parsing stops at the first byte
// sequence which does not continue the number; res.bytes_consumed is the length of the
// number in bytes.
//
// Does not allocate. On failure, value is set to 0 and res.bytes_consumed is 0.
ParseResult ParseDouble(const uint8_t* buffer, int length, int index, const FormattingData& formatting, double& value);

} // namespace bytenum
