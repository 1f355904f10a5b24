#include "catch2/catch.hpp"

#include "decimal_to_double.h"
#include "formatting_data.h"
#include "parse_double.h"

#include "double-conversion/double-conversion.h"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <random>
#include <string>

//==================================================================================================
// Compare with double-conversion
//==================================================================================================

static uint64_t BitsFromFloat(double f)
{
    uint64_t u;
    std::memcpy(&u, &f, sizeof(uint64_t));
    return u;
}

static double ReferenceStrtod(const char* str, int length)
{
    double_conversion::StringToDoubleConverter conv(0, 0.0, 0.0, "Infinity", "NaN");

    int processed = 0;
    const double value = conv.StringToDouble(str, length, &processed);
    CHECK(processed == length);
    return value;
}

static uint64_t UlpDistance(uint64_t x, uint64_t y)
{
    return x < y ? y - x : x - y;
}

TEST_CASE("Reference - shortest")
{
    const auto& dtoa = double_conversion::DoubleToStringConverter::EcmaScriptConverter();
    const bytenum::FormattingData& fd = bytenum::InvariantUtf8();

    std::mt19937_64 random(2);

    int num_tested = 0;
    int num_exact = 0;

    char buf[128];
    for (int i = 0; i < 100000; ++i)
    {
        const uint64_t bits = random() & ~(uint64_t{1} << 63);
        const uint64_t biased_exponent = bits >> 52;
        if (biased_exponent == 0 || biased_exponent == 0x7FF)
            continue;

        double value;
        std::memcpy(&value, &bits, sizeof(uint64_t));

        double_conversion::StringBuilder builder(buf, sizeof(buf));
        dtoa.ToShortest(value, &builder);
        const int length = builder.position();
        builder.Finalize();

        double parsed;
        const auto res = bytenum::ParseDouble(reinterpret_cast<const uint8_t*>(buf), length, 0, fd, parsed);
        CAPTURE(buf);
        CHECK(res);
        CHECK(res.bytes_consumed == length);

        // Digits are not always rounded correctly.
        const uint64_t distance = UlpDistance(bits, BitsFromFloat(parsed));
        CHECK(distance <= 1);

        ++num_tested;
        if (distance == 0)
            ++num_exact;
    }

    INFO("exact: " << num_exact << " / " << num_tested);
    CHECK(num_exact >= num_tested / 100 * 99);
}

TEST_CASE("Reference - random digits")
{
    std::mt19937 random(3);
    std::uniform_int_distribution<int> gen_num_digits(1, 17);
    std::uniform_int_distribution<int> gen_digit(0, 9);
    std::uniform_int_distribution<int> gen_exponent(-300, 290);

    int num_tested = 0;
    int num_exact = 0;

    for (int i = 0; i < 100000; ++i)
    {
        std::string digits;
        const int num_digits = gen_num_digits(random);
        for (int k = 0; k < num_digits; ++k)
        {
            digits += static_cast<char>('0' + gen_digit(random));
        }
        if (digits[0] == '0')
            digits[0] = '1';

        // d.ddd * 10^(scale - 1)
        const int scale = gen_exponent(random);

        const auto res = bytenum::DecimalToDouble(digits.data(), num_digits, scale, false);
        REQUIRE(res);

        const std::string str = digits + "e" + std::to_string(scale - num_digits);
        CAPTURE(str);

        const double expected = ReferenceStrtod(str.data(), static_cast<int>(str.size()));
        const uint64_t distance = UlpDistance(BitsFromFloat(expected), BitsFromFloat(res.value));
        CHECK(distance <= 1);

        ++num_tested;
        if (distance == 0)
            ++num_exact;
    }

    INFO("exact: " << num_exact << " / " << num_tested);
    CHECK(num_exact >= num_tested / 100 * 99);
}
