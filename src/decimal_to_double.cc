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

#include "decimal_to_double.h"

#include "ieee.h"

#include <cassert>
#include <cstdint>
#if _MSC_VER
#include <intrin.h>
#endif

#ifndef BYTENUM_ASSERT
#define BYTENUM_ASSERT(X) assert(X)
#endif

using bytenum::Double;
using bytenum::DecimalStatus;
using bytenum::DecimalToDoubleResult;

//==================================================================================================
// Powers of ten
//==================================================================================================

// A table entry f represents the number f * 2^(e - 64), where 2^63 <= f < 2^64.
//
// The binary exponents e are shared between the positive and the negative powers of ten:
//  10^k  = f_k  * 2^(    e_k - 64)
//  10^-k = f_-k * 2^(1 - e_k - 64)
// since floor(log_2(10^-k)) = -floor(log_2(10^k)) - 1 for all k > 0.

static constexpr int SmallPowersCount = 15;

// 10^k and 10^-k, for k = 1...15.
static constexpr uint64_t SmallPowersOf10[2 * SmallPowersCount] = {
    0xA000000000000000, // 10^1
    0xC800000000000000, // 10^2
    0xFA00000000000000, // 10^3
    0x9C40000000000000, // 10^4
    0xC350000000000000, // 10^5
    0xF424000000000000, // 10^6
    0x9896800000000000, // 10^7
    0xBEBC200000000000, // 10^8
    0xEE6B280000000000, // 10^9
    0x9502F90000000000, // 10^10
    0xBA43B74000000000, // 10^11
    0xE8D4A51000000000, // 10^12
    0x9184E72A00000000, // 10^13
    0xB5E620F480000000, // 10^14
    0xE35FA931A0000000, // 10^15

    0xCCCCCCCCCCCCCCCD, // 10^-1
    0xA3D70A3D70A3D70B, // 10^-2
    0x83126E978D4FDF3C, // 10^-3
    0xD1B71758E219652E, // 10^-4
    0xA7C5AC471B478425, // 10^-5
    0x8637BD05AF6C69B7, // 10^-6
    0xD6BF94D5E57A42BE, // 10^-7
    0xABCC77118461CEFF, // 10^-8
    0x89705F4136B4A599, // 10^-9
    0xDBE6FECEBDEDD5C2, // 10^-10
    0xAFEBFF0BCB24AB02, // 10^-11
    0x8CBCCC096F5088CF, // 10^-12
    0xE12E13424BB40E18, // 10^-13
    0xB424DC35095CD813, // 10^-14
    0x901D7CF73AB0ACDC, // 10^-15
};

static constexpr int SmallPowersExponents[SmallPowersCount] = {
    4, 7, 10, 14, 17, 20, 24, 27, 30, 34, 37, 40, 44, 47, 50,
};

static constexpr int LargePowersCount = 21;

// 10^(16k) and 10^(-16k), for k = 1...21.
static constexpr uint64_t LargePowersOf10[2 * LargePowersCount] = {
    0x8E1BC9BF04000000, // 10^16
    0x9DC5ADA82B70B59E, // 10^32
    0xAF298D050E4395D7, // 10^48
    0xC2781F49FFCFA6D5, // 10^64
    0xD7E77A8F87DAF7FC, // 10^80
    0xEFB3AB16C59B14A3, // 10^96
    0x850FADC09923329E, // 10^112
    0x93BA47C980E98CE0, // 10^128
    0xA402B9C5A8D3A6E7, // 10^144
    0xB616A12B7FE617AA, // 10^160
    0xCA28A291859BBF93, // 10^176
    0xE070F78D3927556B, // 10^192
    0xF92E0C3537826146, // 10^208
    0x8A5296FFE33CC930, // 10^224
    0x9991A6F3D6BF1766, // 10^240
    0xAA7EEBFB9DF9DE8E, // 10^256
    0xBD49D14AA79DBC82, // 10^272
    0xD226FC195C6A2F8C, // 10^288
    0xE950DF20247C83FD, // 10^304
    0x81842F29F2CCE376, // 10^320
    0x8FCAC257558EE4E6, // 10^336

    0xE69594BEC44DE15B, // 10^-16
    0xCFB11EAD453994BA, // 10^-32
    0xBB127C53B17EC159, // 10^-48
    0xA87FEA27A539E9A5, // 10^-64
    0x97C560BA6B0919A6, // 10^-80
    0x88B402F7FD75539B, // 10^-96
    0xF64335BCF065D37D, // 10^-112
    0xDDD0467C64BCE4A1, // 10^-128
    0xC7CABA6E7C5382C9, // 10^-144
    0xB3F4E093DB73A093, // 10^-160
    0xA21727DB38CB0030, // 10^-176
    0x91FF83775423CC06, // 10^-192
    0x8380DEA93DA4BC60, // 10^-208
    0xECE53CEC4A314EBE, // 10^-224
    0xD5605FCDCF32E1D7, // 10^-240
    0xC0314325637A193A, // 10^-256
    0xAD1C8EAB5EE43B67, // 10^-272
    0x9BECCE62836AC577, // 10^-288
    0x8C71DCD9BA0B4926, // 10^-304
    0xFD00B897478238D1, // 10^-320
    0xE3E27A444D8D98B8, // 10^-336
};

static constexpr int LargePowersExponents[LargePowersCount] = {
    54, 107, 160, 213, 266, 319, 373, 426, 479, 532, 585, 638, 691, 745, 798, 851, 904, 957, 1010, 1064, 1117,
};

// Max double: 1.7976931348623157 * 10^308.
// Min non-zero double: 4.9406564584124654 * 10^-324.
// With at most 18 significant digits, any decimal exponent with |e10| >= 352 = 16 * 22 results in
// +Infinity (resp. 0).
static constexpr int MaxDecimalExponent = 16 * (LargePowersCount + 1);

//==================================================================================================
// DecimalToDouble
//==================================================================================================

static inline constexpr int Min(int x, int y) { return y < x ? y : x; }

static inline bool IsDigit(char ch)
{
    return static_cast<unsigned>(ch - '0') <= 9u;
}

// PRE: 1 <= count <= 9
static inline uint32_t DigitsToU32(const char* digits, int count)
{
    BYTENUM_ASSERT(count >= 1);
    BYTENUM_ASSERT(count <= 9);

    uint32_t value = static_cast<uint32_t>(digits[0] - '0');
    for (int i = 1; i < count; ++i)
    {
        value = 10 * value + static_cast<uint32_t>(digits[i] - '0');
    }

    return value;
}

static inline uint64_t Mul32x32To64(uint32_t a, uint32_t b)
{
    return uint64_t{a} * b;
}

#if defined(__SIZEOF_INT128__)

static inline uint64_t MulHi64(uint64_t a, uint64_t b)
{
    __extension__ using uint128_t = unsigned __int128;

    return static_cast<uint64_t>((uint128_t{a} * b) >> 64);
}

#elif defined(_MSC_VER) && defined(_M_X64)

static inline uint64_t MulHi64(uint64_t a, uint64_t b)
{
    return __umulh(a, b);
}

#else

static inline uint32_t Lo32(uint64_t x)
{
    return static_cast<uint32_t>(x);
}

static inline uint32_t Hi32(uint64_t x)
{
    return static_cast<uint32_t>(x >> 32);
}

static inline uint64_t MulHi64(uint64_t a, uint64_t b)
{
    const uint64_t b00 = uint64_t{Lo32(a)} * Lo32(b);
    const uint64_t b01 = uint64_t{Lo32(a)} * Hi32(b);
    const uint64_t b10 = uint64_t{Hi32(a)} * Lo32(b);
    const uint64_t b11 = uint64_t{Hi32(a)} * Hi32(b);

    const uint64_t mid1 = b10 + Hi32(b00);
    const uint64_t mid2 = b01 + Lo32(mid1);

    return b11 + Hi32(mid1) + Hi32(mid2);
}

#endif

// Returns the upper 64 bits of the 128-bit product a * b, normalized such that the
// most significant bit is set. The lower half of the product is discarded.
//
// PRE: a and b are normalized.
static inline uint64_t Mul64Lossy(uint64_t a, uint64_t b, int& e2)
{
    BYTENUM_ASSERT((a >> 63) != 0);
    BYTENUM_ASSERT((b >> 63) != 0);

    // 2^126 <= a * b < 2^128.
    uint64_t p = MulHi64(a, b);
    if ((p >> 63) == 0)
    {
        p <<= 1;
        e2 -= 1;
    }

    return p;
}

// Shifts f to the left until its most significant bit is set.
// Returns the shift amount.
//
// PRE: f != 0
static inline int Normalize(uint64_t& f)
{
    BYTENUM_ASSERT(f != 0);

    int shift = 0;
    if ((f & 0xFFFFFFFF00000000) == 0) { f <<= 32; shift += 32; }
    if ((f & 0xFFFF000000000000) == 0) { f <<= 16; shift += 16; }
    if ((f & 0xFF00000000000000) == 0) { f <<=  8; shift +=  8; }
    if ((f & 0xF000000000000000) == 0) { f <<=  4; shift +=  4; }
    if ((f & 0xC000000000000000) == 0) { f <<=  2; shift +=  2; }
    if ((f & 0x8000000000000000) == 0) { f <<=  1; shift +=  1; }

    return shift;
}

//==================================================================================================
// Bignum comparison
//==================================================================================================

struct DiyInt // bigits * 2^(32 * exponent)
{
    // Holds 2^1075 times an 18-digit integer.
    static constexpr int MaxBits = 64 + 1075 + 32;
    static constexpr int BigitSize = 32;
    static constexpr int Capacity = (MaxBits + (BigitSize - 1)) / BigitSize;

    uint32_t bigits[Capacity]; // Little-endian.
    int      size = 0;
    int      exponent = 0;

    DiyInt() = default;
    DiyInt(DiyInt const&) = delete;
    DiyInt& operator=(DiyInt const&) = delete;
};

static inline void AssignU64(DiyInt& x, uint64_t value)
{
    x.size = 0;
    x.exponent = 0;

    if (value == 0)
        return;

    x.bigits[0] = static_cast<uint32_t>(value);
    x.bigits[1] = static_cast<uint32_t>(value >> DiyInt::BigitSize);
    x.size = (x.bigits[1] == 0) ? 1 : 2;
}

// x := A * x
static inline void MulU32(DiyInt& x, uint32_t A)
{
    uint32_t carry = 0;
    for (int i = 0; i < x.size; ++i)
    {
        const uint64_t p = uint64_t{x.bigits[i]} * A + carry;
        x.bigits[i]      = static_cast<uint32_t>(p);
        carry            = static_cast<uint32_t>(p >> DiyInt::BigitSize);
    }

    if (carry != 0)
    {
        BYTENUM_ASSERT(x.size < DiyInt::Capacity);
        x.bigits[x.size++] = carry;
    }
}

static inline void MulPow2(DiyInt& x, int exp)
{
    BYTENUM_ASSERT(exp >= 0);

    if (x.size == 0 || exp == 0)
        return;

    const int bigit_shift = exp / DiyInt::BigitSize;
    const int bit_shift   = exp % DiyInt::BigitSize;

    if (bit_shift > 0)
    {
        uint32_t carry = 0;
        for (int i = 0; i < x.size; ++i)
        {
            const uint32_t h = x.bigits[i] >> (DiyInt::BigitSize - bit_shift);
            x.bigits[i]      = x.bigits[i] << bit_shift | carry;
            carry            = h;
        }

        if (carry != 0)
        {
            BYTENUM_ASSERT(x.size < DiyInt::Capacity);
            x.bigits[x.size++] = carry;
        }
    }

    x.exponent += bigit_shift;
    BYTENUM_ASSERT(x.size + x.exponent <= DiyInt::Capacity);
}

static inline void MulPow5(DiyInt& x, int exp)
{
    static constexpr uint32_t Pow5[] = {
        1, // (unused)
        5,
        25,
        125,
        625,
        3125,
        15625,
        78125,
        390625,
        1953125,
        9765625,
        48828125,
        244140625,
        1220703125, // 5^13
    };

    BYTENUM_ASSERT(exp >= 0);

    while (exp > 0)
    {
        const int n = Min(exp, 13);
        MulU32(x, Pow5[n]);
        exp -= n;
    }
}

static inline int Compare(DiyInt const& lhs, DiyInt const& rhs)
{
    const int e1 = lhs.exponent;
    const int e2 = rhs.exponent;
    const int n1 = lhs.size + e1;
    const int n2 = rhs.size + e2;

    if (n1 < n2) return -1;
    if (n1 > n2) return +1;

    for (int i = n1 - 1; i >= Min(e1, e2); --i)
    {
        const uint32_t b1 = (i - e1) >= 0 ? lhs.bigits[i - e1] : 0;
        const uint32_t b2 = (i - e2) >= 0 ? rhs.bigits[i - e2] : 0;

        if (b1 < b2) return -1;
        if (b1 > b2) return +1;
    }

    return 0;
}

// Returns whether m * 10^e10 >= 2^-1075, i.e. whether m * 2^(1075 + e10) >= 5^-e10.
//
// PRE: -MaxDecimalExponent < e10 < 0
static bool IsAtLeastHalfDenormMin(uint64_t m, int e10)
{
    BYTENUM_ASSERT(e10 < 0);
    BYTENUM_ASSERT(e10 > -MaxDecimalExponent);

    DiyInt lhs;
    AssignU64(lhs, m);
    MulPow2(lhs, 1075 + e10);

    DiyInt rhs;
    AssignU64(rhs, 1);
    MulPow5(rhs, -e10);

    return Compare(lhs, rhs) >= 0;
}

DecimalToDoubleResult bytenum::DecimalToDouble(const char* digits, int num_digits, int scale, bool is_negative)
{
    if (num_digits < 0)
        return {0.0, DecimalStatus::invalid_digit};

    for (int i = 0; i < num_digits; ++i)
    {
        if (!IsDigit(digits[i]))
            return {0.0, DecimalStatus::invalid_digit};
    }

    const uint64_t sign = is_negative ? Double::SignMask : 0;

    // Skip leading zeros.
    int next = 0;
    while (next < num_digits && digits[next] == '0')
    {
        ++next;
    }

    int remaining = num_digits - next;
    if (remaining == 0)
    {
        return {Double(sign).Value(), DecimalStatus::ok};
    }

    // Read up to 18 significant digits into f.
    // 9 decimal digits always fit into an uint32_t.
    static_assert(bytenum::DecimalToDoubleMaxDigits == 2 * 9, "");

    int count = Min(remaining, 9);
    uint64_t f = DigitsToU32(digits + next, count);
    next += count;
    remaining -= count;

    if (remaining > 0)
    {
        count = Min(remaining, 9);

        // 10^count as an integer.
        const uint32_t pow10 = static_cast<uint32_t>(SmallPowersOf10[count - 1] >> (64 - SmallPowersExponents[count - 1]));

        f = Mul32x32To64(static_cast<uint32_t>(f), pow10) + DigitsToU32(digits + next, count);
        next += count;
        remaining -= count;
    }

    // The remaining digits are ignored.
    // They are beyond the precision of a double and only contribute to the decimal exponent.
    const int64_t e10 = int64_t{scale} - next;
    const int64_t abs_e10 = e10 < 0 ? -e10 : e10;

    if (abs_e10 >= MaxDecimalExponent)
    {
        const uint64_t bits = (e10 > 0) ? Double::InfinityBits : 0;
        return {Double(bits | sign).Value(), DecimalStatus::ok};
    }

    const uint64_t m = f;

    // value = f * 2^(e2 - 64)
    int e2 = 64 - Normalize(f);

    const int k = static_cast<int>(abs_e10);

    const int lo = k & 15;
    if (lo != 0)
    {
        const int e = SmallPowersExponents[lo - 1];
        e2 += (e10 < 0) ? 1 - e : e;
        f = Mul64Lossy(f, SmallPowersOf10[lo - 1 + ((e10 < 0) ? SmallPowersCount : 0)], e2);
    }

    const int hi = k >> 4;
    if (hi != 0)
    {
        const int e = LargePowersExponents[hi - 1];
        e2 += (e10 < 0) ? 1 - e : e;
        f = Mul64Lossy(f, LargePowersOf10[hi - 1 + ((e10 < 0) ? LargePowersCount : 0)], e2);
    }

    // Round to 53 bits. The lower 11 bits of f are discarded below.
    if ((f & (uint64_t{1} << 10)) != 0)
    {
        // Round half to even.
        const uint64_t t = f + ((uint64_t{1} << 10) - 1) + ((f >> 11) & 1);
        if (t < f)
        {
            // Carry out of the most significant bit.
            f = (t >> 1) | (uint64_t{1} << 63);
            e2 += 1;
        }
        else
        {
            f = t;
        }
    }

    // Biased exponent of the result: f * 2^(e2 - 64) = 1.xxx * 2^(e2 - 1)
    e2 += 0x3FE;

    uint64_t bits;
    if (e2 <= 0)
    {
        if (e2 == -52 || e2 == -53)
        {
            // f * 2^(e2 - 0x3FE - 64) is in [denorm_min/4, denorm_min). The lossy products may
            // put it on the wrong side of denorm_min/2, so decide with the exact decimal value.
            // Values in [denorm_min/2, denorm_min) round up to denorm_min.
            bits = IsAtLeastHalfDenormMin(m, static_cast<int>(e10)) ? 1 : 0;
        }
        else if (e2 <= -52)
        {
            bits = 0;
        }
        else
        {
            // Subnormal: no hidden bit.
            bits = f >> (12 - e2);
        }
    }
    else if (e2 >= Double::MaxIeeeExponent)
    {
        bits = Double::InfinityBits;
    }
    else
    {
        bits = Double::ComposeBits(static_cast<uint64_t>(e2), f >> 11);
    }

    return {Double(bits | sign).Value(), DecimalStatus::ok};
}
