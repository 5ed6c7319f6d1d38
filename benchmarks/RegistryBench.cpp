#include <benchmark/benchmark.h>
#include "sockjs/session/SessionRegistry.hpp"

#include <boost/asio/io_context.hpp>

#include <memory>
#include <string>
#include <vector>

namespace {

class NullHandler final : public sockjs::SessionHandler {
public:
    void onMessage(sockjs::SessionContext& ctx, const std::string& payload) override {
        ctx.send(payload);
    }
};

class CountingSink final : public sockjs::TransportSink {
public:
    bool push(const sockjs::Frame&) override { ++frames; return true; }
    void ready() override {}
    bool connected() const noexcept override { return true; }
    std::size_t frames{0};
};

sockjs::HandlerFactory nullFactory() {
    return [](const sockjs::SessionId&) { return std::make_unique<NullHandler>(); };
}

} // namespace

static void BM_DeliverEcho(benchmark::State& state) {
    boost::asio::io_context ioc;
    sockjs::SessionRegistry reg(ioc, nullFactory());
    auto sink = std::make_shared<CountingSink>();
    reg.acquire("bench", sink, [](sockjs::Registry::AcquireResult) {});
    ioc.run();

    for (auto _ : state) {
        for (int i = 0; i < 64; ++i) reg.deliver("bench", "ping");
        ioc.restart();
        ioc.run();
    }
    state.SetItemsProcessed(state.iterations() * 64);
}
BENCHMARK(BM_DeliverEcho)->Unit(benchmark::kMicrosecond);

static void BM_Broadcast(benchmark::State& state) {
    boost::asio::io_context ioc;
    sockjs::RegistryOptions opts;
    opts.shards = 4;
    sockjs::SessionRegistry reg(ioc, nullFactory(), opts);

    std::vector<std::shared_ptr<CountingSink>> sinks;
    for (int i = 0; i < state.range(0); ++i) {
        sinks.push_back(std::make_shared<CountingSink>());
        reg.acquire("s" + std::to_string(i), sinks.back(), [](sockjs::Registry::AcquireResult) {});
    }
    ioc.run();

    for (auto _ : state) {
        reg.broadcast(sockjs::frame::Heartbeat{});
        ioc.restart();
        ioc.run();
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Broadcast)->Arg(16)->Arg(256)->Arg(4096)->Unit(benchmark::kMicrosecond);

static void BM_AcquireRelease(benchmark::State& state) {
    boost::asio::io_context ioc;
    sockjs::SessionRegistry reg(ioc, nullFactory());
    auto sink = std::make_shared<CountingSink>();

    for (auto _ : state) {
        reg.acquire("cycle", sink, [&reg](sockjs::Registry::AcquireResult r) {
            if (r) reg.release(std::move(r.value()));
        });
        ioc.restart();
        ioc.run();
    }
}
BENCHMARK(BM_AcquireRelease)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
