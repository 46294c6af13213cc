#include <array>
#include <string>
#include <string_view>

#include <benchmark/benchmark.h>

#include "kulid/id/id.hpp"

namespace {
struct BenchKind {
    static constexpr kulid::id::u16 kNumber = 0x1A2B;
    static constexpr std::string_view kIdent = "bench";
    static constexpr std::string_view kShortIdent = "bch";
};

using BenchId = kulid::id::Id<BenchKind>;
} // namespace

static void BM_IdMake(benchmark::State& state) {
    for (auto _ : state) {
        const BenchId id = BenchId::make();
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(BM_IdMake);

static void BM_IdMarshalTextTo(benchmark::State& state) {
    const BenchId id = BenchId::make();
    std::array<char, BenchId::encoded_size()> buf{};
    for (auto _ : state) {
        const kulid::core::Status s = id.marshal_text_to({buf.data(), BenchId::encoded_size()});
        benchmark::DoNotOptimize(s);
        benchmark::ClobberMemory();
    }
}
BENCHMARK(BM_IdMarshalTextTo);

static void BM_IdToString(benchmark::State& state) {
    const BenchId id = BenchId::make();
    for (auto _ : state) {
        benchmark::DoNotOptimize(id.to_string());
    }
}
BENCHMARK(BM_IdToString);

static void BM_IdUnmarshalShort(benchmark::State& state) {
    const std::string text = BenchId::make().to_string();
    for (auto _ : state) {
        BenchId id;
        const kulid::core::Status s = id.unmarshal_text(text);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(BM_IdUnmarshalShort);

static void BM_IdUnmarshalLong(benchmark::State& state) {
    const std::string text = BenchId::make().to_long_string();
    for (auto _ : state) {
        BenchId id;
        const kulid::core::Status s = id.unmarshal_text(text);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(BM_IdUnmarshalLong);
