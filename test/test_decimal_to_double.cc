#include "catch2/catch.hpp"

#include "decimal_to_double.h"
#include "ieee.h"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <random>
#include <string>

//==================================================================================================
// DecimalToDouble
//==================================================================================================

static uint64_t BitsFromFloat(double f)
{
    uint64_t u;
    std::memcpy(&u, &f, sizeof(uint64_t));
    return u;
}

static uint64_t Convert(const std::string& digits, int scale, bool is_negative = false)
{
    const auto res = bytenum::DecimalToDouble(digits.data(), static_cast<int>(digits.size()), scale, is_negative);
    CHECK(res.status == bytenum::DecimalStatus::ok);
    return BitsFromFloat(res.value);
}

TEST_CASE("DecimalToDouble - zero")
{
    CHECK(0x0000000000000000 == Convert("0", 1));
    CHECK(0x0000000000000000 == Convert("0000", 4));
    CHECK(0x0000000000000000 == Convert("0", 500));
    CHECK(0x0000000000000000 == Convert("0", -500));
    CHECK(0x0000000000000000 == Convert("", 0));
    CHECK(0x8000000000000000 == Convert("0", 1, true));
    CHECK(0x8000000000000000 == Convert("000", 3, true));
}

TEST_CASE("DecimalToDouble - small integers and fractions")
{
    CHECK(0x3FF0000000000000 == Convert("1", 1));       // 1
    CHECK(0x3FF8000000000000 == Convert("15", 1));      // 1.5
    CHECK(0x3FB999999999999A == Convert("1", 0));       // 0.1
    CHECK(0x405EDD2F1A9FBE77 == Convert("123456", 3));  // 123.456
    CHECK(0xC004000000000000 == Convert("25", 1, true)); // -2.5
    CHECK(0x3EE4F8B588E368F1 == Convert("1", -4));      // 1e-5

    // Leading zeros are not significant.
    CHECK(0x405EC00000000000 == Convert("000123", 6));
    CHECK(0x405EC00000000000 == Convert("123", 3));
}

TEST_CASE("DecimalToDouble - powers of ten")
{
    double p = 1.0;
    for (int k = 0; k <= 22; ++k)
    {
        CAPTURE(k);
        CHECK(BitsFromFloat(p) == Convert("1", k + 1));
        p *= 10;
    }

    CHECK(BitsFromFloat(1e23) == Convert("1", 24));
    CHECK(BitsFromFloat(1e-1) == Convert("1", 0));
    CHECK(BitsFromFloat(1e-10) == Convert("1", -9));
    CHECK(BitsFromFloat(1e-22) == Convert("1", -21));
}

TEST_CASE("DecimalToDouble - long inputs")
{
    // Only the first 18 digits are significant.
    CHECK(0x44BA249B1F10A06D == Convert("123456789012345678901234", 24));
    CHECK(0x43E0000000000000 == Convert("9223372036854775808", 19)); // 2^63
    CHECK(0x400921FB54442D18 == Convert("314159265358979323846264338327950288", 1));
    CHECK(0x3FF0000000000000 == Convert("100000000000000000000000000000000000000", 1));
}

TEST_CASE("DecimalToDouble - round half to even")
{
    // 2^53 + 1 lies halfway between 2^53 and 2^53 + 2.
    CHECK(0x4340000000000000 == Convert("9007199254740993", 16));
    // 2^53 + 3 lies halfway between 2^53 + 2 and 2^53 + 4.
    CHECK(0x4340000000000002 == Convert("9007199254740995", 16));

    // 2^54 + 2 lies halfway between 2^54 and 2^54 + 4.
    CHECK(0x4350000000000000 == Convert("18014398509481986", 17));
    // 2^54 + 6 lies halfway between 2^54 + 4 and 2^54 + 8.
    CHECK(0x4350000000000002 == Convert("18014398509481990", 17));
}

TEST_CASE("DecimalToDouble - max and overflow")
{
    CHECK(0x7FEFFFFFFFFFFFFF == Convert("17976931348623157", 309));
    CHECK(0x7FEFFFFFFFFFFFFF == Convert("17976931348623158", 309));
    CHECK(0x7FF0000000000000 == Convert("17976931348623159", 309));
    CHECK(0x7FF0000000000000 == Convert("1", 310));
    CHECK(0xFFF0000000000000 == Convert("1", 310, true));

    // Decimal exponents >= 352 are not even looked up.
    CHECK(0x7FF0000000000000 == Convert("1", 352));
    CHECK(0x7FF0000000000000 == Convert("1", 353));
    CHECK(0x7FF0000000000000 == Convert("1", std::numeric_limits<int>::max()));
    CHECK(0xFFF0000000000000 == Convert("1", std::numeric_limits<int>::max(), true));
}

TEST_CASE("DecimalToDouble - min, subnormals and underflow")
{
    CHECK(0x0010000000000000 == Convert("22250738585072014", -307)); // min normal
    CHECK(0x000FFFFFFFFFFFFF == Convert("22250738585072011", -307)); // max subnormal
    CHECK(0x000FFFFFFFFFFFFF == Convert("22250738585072012", -307)); // truncated, not rounded up
    CHECK(0x0000000000000001 == Convert("49406564584124654", -323)); // denorm_min
    CHECK(0x0000000000000001 == Convert("5", -323));

    // Values in [denorm_min/2, denorm_min) round up to denorm_min.
    CHECK(0x0000000000000001 == Convert("24703282292062328", -323));
    CHECK(0x0000000000000001 == Convert("2470328229206232731", -323));
    CHECK(0x0000000000000001 == Convert("247032822920623273", -323));
    CHECK(0x0000000000000001 == Convert("25", -323));
    CHECK(0x8000000000000001 == Convert("25", -323, true));

    CHECK(0x0000000000000000 == Convert("24703282292062327", -323));
    CHECK(0x0000000000000000 == Convert("247032822920623272", -323));
    CHECK(0x0000000000000000 == Convert("24", -323));
    CHECK(0x0000000000000000 == Convert("1", -323));
    CHECK(0x0000000000000000 == Convert("1", -351));
    CHECK(0x0000000000000000 == Convert("1", -352));
    CHECK(0x0000000000000000 == Convert("1", std::numeric_limits<int>::min()));
    CHECK(0x8000000000000000 == Convert("1", std::numeric_limits<int>::min(), true));
}

TEST_CASE("DecimalToDouble - half denorm_min")
{
    // denorm_min/2 = 2^-1075 = 2.47032822920623272088...e-324
    // 17-digit inputs in [denorm_min/4, denorm_min) give 0 below and 1 at or above.
    const uint64_t half = 24703282292062328;

    uint64_t prev = 0;
    const auto check = [&](uint64_t v) {
        const uint64_t bits = Convert(std::to_string(v), -323);
        CAPTURE(v);
        CHECK(bits == (v >= half ? 1u : 0u));
        CHECK(bits >= prev);
        prev = bits;
    };

    for (uint64_t v = 12352000000000000; v < half - 100; v += 7000000000000)
    {
        check(v);
    }
    for (uint64_t v = half - 100; v < half + 100; ++v)
    {
        check(v);
    }
    for (uint64_t v = half + 100; v < 49406000000000000; v += 7000000000000)
    {
        check(v);
    }
}

TEST_CASE("DecimalToDouble - result classes")
{
    using bytenum::Double;

    CHECK(Double(Convert("0", 1)).IsZero());
    CHECK(!Double(Convert("0", 1)).SignBit());
    CHECK(Double(Convert("0", 1, true)).IsZero());
    CHECK(Double(Convert("0", 1, true)).SignBit());

    CHECK(Double(Convert("5", -323)).IsSubnormal());
    CHECK(Double(Convert("22250738585072011", -307)).IsSubnormal());
    CHECK(!Double(Convert("22250738585072014", -307)).IsSubnormal());
    CHECK(Double(Convert("22250738585072014", -307)).PhysicalExponent() == 1);
    CHECK(Double(Convert("22250738585072014", -307)).PhysicalSignificand() == 0);

    CHECK(Double(Convert("1", 400)).IsInf());
    CHECK(!Double(Convert("1", 400)).IsFinite());
    CHECK(!Double(Convert("1", 400)).IsNaN());
    CHECK(Double(Convert("17976931348623157", 309)).IsFinite());
    CHECK(Double(Convert("17976931348623157", 309)).PhysicalExponent() == 2046);
}

TEST_CASE("DecimalToDouble - invalid digits")
{
    const char* digits = "12a4";

    auto res = bytenum::DecimalToDouble(digits, 4, 4, false);
    CHECK(!res);
    CHECK(res.status == bytenum::DecimalStatus::invalid_digit);
    CHECK(res.value == 0.0);

    // The prefix is fine.
    res = bytenum::DecimalToDouble(digits, 2, 2, false);
    CHECK(res);
    CHECK(res.value == 12.0);

    res = bytenum::DecimalToDouble(digits, -1, 0, false);
    CHECK(res.status == bytenum::DecimalStatus::invalid_digit);

    res = bytenum::DecimalToDouble(" 1", 2, 2, false);
    CHECK(res.status == bytenum::DecimalStatus::invalid_digit);
}

TEST_CASE("DecimalToDouble - round trip")
{
    // Normalized doubles printed with 17 significant digits.
    std::mt19937_64 random(1);

    char buf[64];
    for (int i = 0; i < 20000; ++i)
    {
        const uint64_t bits = random();
        const uint64_t biased_exponent = (bits >> 52) & 0x7FF;
        if (biased_exponent == 0 || biased_exponent == 0x7FF)
            continue;

        double value;
        std::memcpy(&value, &bits, sizeof(uint64_t));

        // d.dddddddddddddddde[+-]xxx
        std::snprintf(buf, sizeof(buf), "%.16e", std::abs(value));

        std::string digits;
        digits += buf[0];
        digits.append(buf + 2, 16);
        const int exponent = std::atoi(buf + 19);

        CAPTURE(buf);
        CHECK(bits == Convert(digits, exponent + 1, value < 0));
    }
}
