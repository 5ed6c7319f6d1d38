#pragma once

#include "sockjs/protocol/Frame.hpp"
#include "sockjs/session/SessionHandler.hpp"
#include "sockjs/session/TransportSink.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sockjs::test {

inline std::string text(const Frame& f) { return encodeText(f).value_or("<blob>"); }

// Shared log of handler callbacks, outliving the handler the registry owns.
struct HandlerLog {
    std::mutex mu;
    std::vector<std::string> events;

    void add(std::string e) {
        std::lock_guard<std::mutex> lk(mu);
        events.push_back(std::move(e));
    }
    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lk(mu);
        return events;
    }
    std::size_t count(const std::string& e) {
        std::lock_guard<std::mutex> lk(mu);
        std::size_t n = 0;
        for (auto& x : events) n += (x == e);
        return n;
    }
};

// Records callbacks; optional hooks let a test script replies.
class RecordingHandler final : public SessionHandler {
public:
    explicit RecordingHandler(std::shared_ptr<HandlerLog> log) : log_(std::move(log)) {}

    std::function<void(SessionContext&)> onOpened;
    std::function<void(SessionContext&, const std::string&)> onMsg;

    void opened(SessionContext& ctx) override {
        log_->add("opened:" + ctx.sid());
        if (onOpened) onOpened(ctx);
    }
    void acquired(SessionContext& ctx) override { log_->add("acquired:" + ctx.sid()); }
    void released(SessionContext& ctx) override { log_->add("released:" + ctx.sid()); }
    void closed(SessionContext& ctx, bool interrupted) override {
        log_->add(std::string(interrupted ? "interrupted:" : "closed:") + ctx.sid());
    }
    void onMessage(SessionContext& ctx, const std::string& payload) override {
        log_->add("msg:" + ctx.sid() + ":" + payload);
        if (onMsg) onMsg(ctx, payload);
    }

private:
    std::shared_ptr<HandlerLog> log_;
};

// Factory producing RecordingHandlers with shared hooks.
struct RecordingFactory {
    std::shared_ptr<HandlerLog> log = std::make_shared<HandlerLog>();
    std::function<void(SessionContext&)> onOpened;
    std::function<void(SessionContext&, const std::string&)> onMsg;

    HandlerFactory make() {
        return [this](const SessionId&) {
            auto h = std::make_unique<RecordingHandler>(log);
            h->onOpened = onOpened;
            h->onMsg    = onMsg;
            return h;
        };
    }
};

// Sink standing in for an attached transport.
class FakeSink final : public TransportSink {
public:
    bool push(const Frame& f) override {
        if (!accepting) return false;
        frames.push_back(text(f));
        return true;
    }
    void ready() override {
        ++readyCount;
        frames.push_back("<ready>");
    }
    bool connected() const noexcept override { return live; }

    bool accepting{true};
    bool live{true};
    int readyCount{0};
    std::vector<std::string> frames;
};

} // namespace sockjs::test
