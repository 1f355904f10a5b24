#include "benchmark/benchmark.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <iterator>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "formatting_data.h"
#include "parse_double.h"

#define BENCH_PARSE_UTF8()      1
#define BENCH_PARSE_UTF16()     1
#define BENCH_STD_STRTOD()      1

static constexpr int NumFloats = 1 << 14;

// Input strings in both encodings.
struct Numbers
{
    std::vector<std::string> utf8;
    std::vector<std::string> utf16;
};

#if BENCH_PARSE_UTF8()
struct S2DParseUtf8
{
    using value_type = double;

    value_type operator()(Numbers const& numbers, size_t index) const
    {
        std::string const& str = numbers.utf8[index];

        value_type flt = 0;
        const auto res = bytenum::ParseDouble(reinterpret_cast<uint8_t const*>(str.data()), static_cast<int>(str.size()), 0, bytenum::InvariantUtf8(), flt);
        static_cast<void>(res);
        return flt;
    }
};
#endif

#if BENCH_PARSE_UTF16()
struct S2DParseUtf16
{
    using value_type = double;

    value_type operator()(Numbers const& numbers, size_t index) const
    {
        std::string const& str = numbers.utf16[index];

        value_type flt = 0;
        const auto res = bytenum::ParseDouble(reinterpret_cast<uint8_t const*>(str.data()), static_cast<int>(str.size()), 0, bytenum::InvariantUtf16(), flt);
        static_cast<void>(res);
        return flt;
    }
};
#endif

#if BENCH_STD_STRTOD()
struct S2DStdStrtod
{
    using value_type = double;

    value_type operator()(Numbers const& numbers, size_t index) const
    {
        value_type flt = std::strtod(numbers.utf8[index].c_str(), nullptr);
        return flt;
    }
};
#endif

template <typename Converter>
static void BenchIt(benchmark::State& state, Numbers const& numbers)
{
    Converter convert;

    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize( convert(numbers, index) );
        index = (index + 1) & (NumFloats - 1);
    }
}

template <typename Converter>
static void RegisterBenchmarks(char const* name, Numbers const& numbers)
{
    auto* bench = benchmark::RegisterBenchmark(name, BenchIt<Converter>, numbers);

    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->ReportAggregatesOnly();
}

class JenkinsRandom
{
    // A small noncryptographic PRNG
    // http://burtleburtle.net/bob/rand/smallprng.html

    uint32_t a;
    uint32_t b;
    uint32_t c;
    uint32_t d;

    static uint32_t Rotate(uint32_t value, int n) {
        return (value << n) | (value >> (32 - n));
    }

    uint32_t Gen() {
        const uint32_t e = a - Rotate(b, 27);
        a = b ^ Rotate(c, 17);
        b = c + d;
        c = d + e;
        d = e + a;
        return d;
    }

public:
    using result_type = uint32_t;

    static constexpr uint32_t min() { return 0; }
    static constexpr uint32_t max() { return UINT32_MAX; }

    explicit JenkinsRandom(uint32_t seed = 0) {
        a = 0xF1EA5EED;
        b = seed;
        c = seed;
        d = seed;
        for (int i = 0; i < 20; ++i) {
            static_cast<void>(Gen());
        }
    }

    uint32_t operator()() { return Gen(); }
};

static JenkinsRandom rng;

static std::string ToUtf16(std::string const& str)
{
    std::string out;
    for (char const ch : str)
    {
        out.push_back(ch);
        out.push_back('\0');
    }
    return out;
}

static std::string StrPrintf(char const* format, char const* name, char const* converter)
{
    char buf[1024];
    std::snprintf(buf, 1024, format, name, converter);
    return buf;
}

static inline void RegisterUniform_double(char const* name, char const* format, double min, double max)
{
    Numbers numbers;
    numbers.utf8.resize(NumFloats);

    std::uniform_real_distribution<double> gen(min, max);

    std::generate(numbers.utf8.begin(), numbers.utf8.end(), [&] {
        char buf[128];
        const int len = std::snprintf(buf, 128, format, gen(rng));
        return std::string(buf, buf + len);
    });
    std::transform(numbers.utf8.begin(), numbers.utf8.end(), std::back_inserter(numbers.utf16), ToUtf16);

#if BENCH_PARSE_UTF8()
    RegisterBenchmarks<S2DParseUtf8>(StrPrintf("%s %-16s", name, "ParseDouble utf8").c_str(), numbers);
#endif
#if BENCH_PARSE_UTF16()
    RegisterBenchmarks<S2DParseUtf16>(StrPrintf("%s %-16s", name, "ParseDouble utf16").c_str(), numbers);
#endif
#if BENCH_STD_STRTOD()
    RegisterBenchmarks<S2DStdStrtod>(StrPrintf("%s %-16s", name, "std::strtod").c_str(), numbers);
#endif
}

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    RegisterUniform_double("warm up", "%.17g", 0, 1);
    RegisterUniform_double("warm up", "%.17g", 0, 1);

    RegisterUniform_double("uniform [0,1]   %.17g", "%.17g", 0.0, 1.0);
    RegisterUniform_double("uniform [0,1]   %.6g ", "%.6g", 0.0, 1.0);
    RegisterUniform_double("uniform [1,2]   %.17g", "%.17g", 1.0, 2.0);
    RegisterUniform_double("uniform [8,2^10] %.17g", "%.17g", 8.0, 1ll << 10);
    RegisterUniform_double("uniform [2^20,2^50] %.17g", "%.17g", 1ll << 20, 1ll << 50);
    RegisterUniform_double("uniform [0,max] %.16e", "%.16e", 0.0, std::numeric_limits<double>::max());

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
