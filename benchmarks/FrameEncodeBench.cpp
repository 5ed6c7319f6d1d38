#include <benchmark/benchmark.h>
#include "sockjs/protocol/Frame.hpp"

#include <string>
#include <vector>

static void BM_EncodeMessage(benchmark::State& state) {
    const sockjs::Frame f = sockjs::frame::Message{std::string(static_cast<std::size_t>(state.range(0)), 'x')};
    for (auto _ : state) {
        auto text = sockjs::encodeText(f);
        benchmark::DoNotOptimize(text);
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeMessage)->Arg(16)->Arg(256)->Arg(4096);

static void BM_EncodeEscapedMessage(benchmark::State& state) {
    const sockjs::Frame f = sockjs::frame::Message{"{\"user\":\"a\\b\",\"text\":\"line\\nbreak\"}"};
    for (auto _ : state) {
        auto text = sockjs::encodeText(f);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(BM_EncodeEscapedMessage);

static void BM_EncodeBatch(benchmark::State& state) {
    std::vector<std::string> payloads(static_cast<std::size_t>(state.range(0)), "payload");
    const sockjs::Frame f = sockjs::frame::MessageBatch{payloads};
    for (auto _ : state) {
        auto text = sockjs::encodeText(f);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeBatch)->Arg(1)->Arg(16)->Arg(128);

BENCHMARK_MAIN();
