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

namespace bytenum {

// Number of significant digits used by DecimalToDouble. Any further digits are ignored.
constexpr int DecimalToDoubleMaxDigits = 18;

enum class DecimalStatus {
    ok,
    invalid_digit,
};

struct DecimalToDoubleResult
{
    double value;
    DecimalStatus status;

    // Test for success.
    explicit operator bool() const noexcept
    {
        return status == DecimalStatus::ok;
    }
};

// DecimalToDoubleResult res = DecimalToDouble(digits, num_digits, scale, is_negative);
//
// Converts the decimal number
//
//      (-1)^is_negative * digits * 10^(scale - num_digits)
//
// into the nearest IEEE double-precision number, i.e. 'scale' is the position of the decimal
// point relative to the first digit in 'digits'. Leading zeros are allowed.
//
// Only the first DecimalToDoubleMaxDigits significant digits are used. Ties are resolved using round-half-to-even.
// Overflow results in +/-Infinity and underflow in +/-0; neither is reported as an error.
// Note that subnormal results are truncated, not rounded. E.g. 2.2250738585072012e-308 gives
// 0x000FFFFFFFFFFFFF (the largest subnormal), where correct rounding gives 0x0010000000000000.
// Values in [denorm_min/2, denorm_min) are the exception: they round up to denorm_min.
//
// Returns DecimalStatus::invalid_digit (and value = 0) if 'digits' contains a character
// outside '0'...'9' or if num_digits is negative.
DecimalToDoubleResult DecimalToDouble(const char* digits, int num_digits, int scale, bool is_negative);

} // namespace bytenum
