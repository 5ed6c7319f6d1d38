#include <benchmark/benchmark.h>
#include "sockjs/protocol/Inbound.hpp"

#include <string>

static std::string makeArray(int n) {
    std::string s = "[";
    for (int i = 0; i < n; ++i) {
        if (i) s += ',';
        s += "\"message number " + std::to_string(i) + "\"";
    }
    return s + "]";
}

static void BM_DecodeArray(benchmark::State& state) {
    const std::string text = makeArray(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto r = sockjs::decodeInbound(text);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DecodeArray)->Arg(1)->Arg(16)->Arg(256);

static void BM_DecodeMalformed(benchmark::State& state) {
    const std::string text = "[\"unterminated";
    for (auto _ : state) {
        auto r = sockjs::decodeInbound(text);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_DecodeMalformed);

BENCHMARK_MAIN();
