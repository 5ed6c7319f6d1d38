#include "sockjs/session/SessionRegistry.hpp"
#include "sockjs/transport/TransportAdapter.hpp"
#include "support/Recording.hpp"

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace sockjs;
using namespace sockjs::test;

namespace {

// In-memory transport: records what would go on the wire.
class FakeTransport final : public TransportAdapter {
public:
    FakeTransport(Executor ex, std::shared_ptr<Registry> reg)
        : TransportAdapter(std::move(ex), std::move(reg)) {
        setConnected(true);
    }

    void disconnect() { setConnected(false); }

    std::vector<std::string> written;
    std::vector<WireClose> closes;
    bool writable{true};
    int attachedCount{0};

protected:
    bool writeText(std::string text) override {
        if (!writable) return false;
        written.push_back(std::move(text));
        return true;
    }
    void closeWire(WireClose how) override {
        closes.push_back(how);
        writable = false;
    }
    void attached() override { ++attachedCount; }
};

} // namespace

class TransportAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        reg = std::make_shared<SessionRegistry>(ioc, factory.make());
    }

    void drain() {
        ioc.restart();
        ioc.run();
    }

    std::shared_ptr<FakeTransport> attach(const SessionId& sid) {
        auto t = std::make_shared<FakeTransport>(ioc.get_executor(), reg);
        t->init(sid);
        drain();
        return t;
    }

    std::optional<Record> inspect(const SessionId& sid) {
        std::optional<Record> out;
        reg->inspect(sid, [&out](std::optional<Record> r) { out = std::move(r); });
        drain();
        return out;
    }

    boost::asio::io_context ioc;
    RecordingFactory factory;
    std::shared_ptr<SessionRegistry> reg;
};

TEST_F(TransportAdapterTest, NewSessionSendsOpenBeforeMessages) {
    factory.onOpened = [](SessionContext& ctx) { ctx.send("welcome"); };
    auto t = attach("s1");

    const std::vector<std::string> expected{ "o", "a[\"welcome\"]" };
    EXPECT_EQ(t->written, expected);
    EXPECT_EQ(t->phase(), TransportAdapter::Phase::Ready);
    EXPECT_EQ(t->attachedCount, 1);
    EXPECT_TRUE(t->closes.empty());
}

TEST_F(TransportAdapterTest, LiveFramesAreForwardedWhenReady) {
    auto t = attach("s1");
    reg->send("s1", "x");
    reg->broadcast(frame::Heartbeat{});
    drain();

    const std::vector<std::string> expected{ "o", "a[\"x\"]", "h" };
    EXPECT_EQ(t->written, expected);
}

TEST_F(TransportAdapterTest, ReattachReplaysBacklogWithoutOpen) {
    auto first = attach("s1");
    first->release();
    drain();

    reg->send("s1", "m1");
    reg->send("s1", "m2");
    drain();

    auto second = attach("s1");
    const std::vector<std::string> expected{ "a[\"m1\"]", "a[\"m2\"]" };
    EXPECT_EQ(second->written, expected);
    EXPECT_EQ(factory.log->count("acquired:s1"), 1u);
}

TEST_F(TransportAdapterTest, FramesAfterReleaseStayWithTheSession) {
    auto first = attach("s1");
    first->release();
    reg->send("s1", "after");
    drain();

    EXPECT_EQ(first->written.back(), "o");

    auto second = attach("s1");
    ASSERT_EQ(second->written.size(), 1u);
    EXPECT_EQ(second->written.front(), "a[\"after\"]");
}

TEST_F(TransportAdapterTest, InboundMessagesAreDeliveredInOrder) {
    auto t = attach("s1");
    t->onInbound("[\"a\",\"b\"]");
    t->onInbound("\"c\"");
    drain();

    const auto events = factory.log->snapshot();
    const std::vector<std::string> expected{ "opened:s1", "msg:s1:a", "msg:s1:b", "msg:s1:c" };
    EXPECT_EQ(events, expected);
}

TEST_F(TransportAdapterTest, EmptyInboundIsIgnored) {
    auto t = attach("s1");
    t->onInbound("");
    t->onInbound("[]");
    drain();

    EXPECT_EQ(factory.log->snapshot().size(), 1u);  // opened only
    EXPECT_TRUE(t->closes.empty());
}

TEST_F(TransportAdapterTest, MalformedInboundClosesOnceAndInterrupts) {
    auto t = attach("s1");
    t->onInbound("not json");
    t->onInbound("[\"x\"]");
    drain();

    ASSERT_EQ(t->closes.size(), 1u);
    EXPECT_EQ(t->closes.front(), WireClose::InvalidPayload);
    EXPECT_EQ(t->phase(), TransportAdapter::Phase::Released);

    EXPECT_EQ(factory.log->count("msg:s1:x"), 0u);
    EXPECT_EQ(factory.log->count("released:s1"), 1u);
    EXPECT_EQ(factory.log->count("interrupted:s1"), 1u);

    auto held = inspect("s1");
    ASSERT_TRUE(held.has_value());
    EXPECT_EQ(held->state, SessionState::Interrupted);
    EXPECT_EQ(held->attachment, 0u);
}

TEST_F(TransportAdapterTest, BinaryFramesAreDroppedSilently) {
    auto t = attach("s1");
    t->onBinary(16);
    drain();

    EXPECT_EQ(factory.log->snapshot().size(), 1u);
    EXPECT_TRUE(t->closes.empty());
    EXPECT_EQ(t->phase(), TransportAdapter::Phase::Ready);

    auto held = inspect("s1");
    ASSERT_TRUE(held.has_value());
    EXPECT_EQ(held->state, SessionState::Running);
}

TEST_F(TransportAdapterTest, PeerCloseClosesTheSession) {
    auto t = attach("s1");
    t->onPeerClose();
    drain();

    EXPECT_EQ(factory.log->count("closed:s1"), 1u);

    // Later connections get the same close frame and nothing else.
    for (int i = 0; i < 2; ++i) {
        auto again = attach("s1");
        const std::vector<std::string> expected{ "c[3000,\"Go away!\"]" };
        EXPECT_EQ(again->written, expected);
        ASSERT_EQ(again->closes.size(), 1u);
        EXPECT_EQ(again->closes.front(), WireClose::Normal);
        EXPECT_EQ(again->phase(), TransportAdapter::Phase::Released);
    }
    EXPECT_EQ(factory.log->count("closed:s1"), 1u);
}

TEST_F(TransportAdapterTest, InterruptedSessionAnswersWithInterruptedClose) {
    auto t = attach("s1");
    t->onProtocolError("connection reset");
    drain();

    ASSERT_EQ(t->closes.size(), 1u);
    EXPECT_EQ(t->closes.front(), WireClose::Abort);
    EXPECT_EQ(factory.log->count("interrupted:s1"), 1u);

    auto again = attach("s1");
    const std::vector<std::string> expected{ "c[1002,\"Connection interrupted\"]" };
    EXPECT_EQ(again->written, expected);
}

TEST_F(TransportAdapterTest, SecondConnectionIsTurnedAway) {
    auto first  = attach("s1");
    auto second = attach("s1");

    const std::vector<std::string> expected{ "c[2010,\"Another connection still open\"]" };
    EXPECT_EQ(second->written, expected);
    ASSERT_EQ(second->closes.size(), 1u);
    EXPECT_EQ(second->phase(), TransportAdapter::Phase::Released);

    // The first connection keeps working.
    reg->send("s1", "still yours");
    drain();
    EXPECT_EQ(first->written.back(), "a[\"still yours\"]");
    EXPECT_TRUE(first->closes.empty());
}

TEST_F(TransportAdapterTest, StoppedRegistryAnswersInternalError) {
    reg->stop();
    auto t = attach("s1");

    const std::vector<std::string> expected{ "c[1011,\"Internal error\"]" };
    EXPECT_EQ(t->written, expected);
    ASSERT_EQ(t->closes.size(), 1u);
}

TEST_F(TransportAdapterTest, RegistryCloseEndsTheConnection) {
    auto t = attach("s1");
    reg->close("s1");
    drain();

    EXPECT_EQ(t->written.back(), "c[3000,\"Go away!\"]");
    ASSERT_EQ(t->closes.size(), 1u);
    EXPECT_EQ(t->closes.front(), WireClose::Normal);
    EXPECT_EQ(t->phase(), TransportAdapter::Phase::Released);
    EXPECT_EQ(factory.log->count("closed:s1"), 1u);

    auto held = inspect("s1");
    ASSERT_TRUE(held.has_value());
    EXPECT_EQ(held->state, SessionState::Closed);
    EXPECT_EQ(held->attachment, 0u);
}

TEST_F(TransportAdapterTest, FailedBacklogFrameIsNotRequeued) {
    auto first = attach("s1");
    first->release();
    reg->send("s1", "m1");
    reg->send("s1", "m2");
    drain();

    auto second = std::make_shared<FakeTransport>(ioc.get_executor(), reg);
    second->writable = false;
    second->init("s1");
    drain();

    EXPECT_TRUE(second->written.empty());
    EXPECT_EQ(second->attachedCount, 0);
    EXPECT_EQ(second->phase(), TransportAdapter::Phase::Released);

    // m1 was taken off the backlog and lost with the failed write.
    auto third = attach("s1");
    const std::vector<std::string> expected{ "a[\"m2\"]" };
    EXPECT_EQ(third->written, expected);
}

TEST_F(TransportAdapterTest, ReleaseWhilePendingHandsTheRecordBack) {
    auto first = attach("s1");
    first->release();
    drain();

    auto t = std::make_shared<FakeTransport>(ioc.get_executor(), reg);
    t->init("s1");
    t->release();
    drain();

    EXPECT_EQ(t->phase(), TransportAdapter::Phase::Released);
    EXPECT_TRUE(t->written.empty());

    auto held = inspect("s1");
    ASSERT_TRUE(held.has_value());
    EXPECT_EQ(held->attachment, 0u);
    EXPECT_EQ(held->state, SessionState::Running);

    auto again = attach("s1");
    EXPECT_TRUE(again->closes.empty());
    EXPECT_EQ(again->phase(), TransportAdapter::Phase::Ready);
}

TEST_F(TransportAdapterTest, NewSessionReleasedBeforeOpenIsInterrupted) {
    factory.onOpened = [](SessionContext& ctx) { ctx.send("welcome"); };

    auto t = std::make_shared<FakeTransport>(ioc.get_executor(), reg);
    t->init("s1");
    t->release();
    drain();

    EXPECT_TRUE(t->written.empty());
    EXPECT_EQ(factory.log->count("interrupted:s1"), 1u);

    // Never a message without the open frame in front of it.
    auto again = attach("s1");
    const std::vector<std::string> expected{ "c[1002,\"Connection interrupted\"]" };
    EXPECT_EQ(again->written, expected);
    EXPECT_EQ(again->phase(), TransportAdapter::Phase::Released);
}

TEST_F(TransportAdapterTest, RefusedOpenInterruptsNewSession) {
    factory.onOpened = [](SessionContext& ctx) { ctx.send("welcome"); };

    auto t = std::make_shared<FakeTransport>(ioc.get_executor(), reg);
    t->writable = false;
    t->init("s1");
    drain();

    EXPECT_TRUE(t->written.empty());
    EXPECT_EQ(t->attachedCount, 0);
    EXPECT_EQ(t->phase(), TransportAdapter::Phase::Released);
    EXPECT_EQ(factory.log->count("interrupted:s1"), 1u);

    auto again = attach("s1");
    const std::vector<std::string> expected{ "c[1002,\"Connection interrupted\"]" };
    EXPECT_EQ(again->written, expected);
}

TEST_F(TransportAdapterTest, HeartbeatFollowsReplayedBacklog) {
    auto first = attach("s1");
    first->release();
    reg->send("s1", "m1");
    reg->send("s1", "m2");
    drain();

    // Broadcast lands while the second transport is still being attached.
    auto second = std::make_shared<FakeTransport>(ioc.get_executor(), reg);
    second->init("s1");
    reg->broadcast(frame::Heartbeat{});
    drain();

    const std::vector<std::string> expected{ "a[\"m1\"]", "a[\"m2\"]", "h" };
    EXPECT_EQ(second->written, expected);
    EXPECT_EQ(second->phase(), TransportAdapter::Phase::Ready);

    auto held = inspect("s1");
    ASSERT_TRUE(held.has_value());
    EXPECT_TRUE(held->buffer.empty());
}

TEST_F(TransportAdapterTest, ReleaseIsIdempotent) {
    auto t = attach("s1");
    t->release();
    t->release();
    drain();
    EXPECT_EQ(factory.log->count("released:s1"), 1u);
}

TEST_F(TransportAdapterTest, DisconnectedReleaseInterrupts) {
    auto t = attach("s1");
    t->disconnect();
    t->release();
    drain();

    EXPECT_EQ(factory.log->count("interrupted:s1"), 1u);
}

TEST_F(TransportAdapterTest, DestroyedTransportReleasesItsRecord) {
    {
        auto t = attach("s1");
        t->disconnect();
    }
    drain();

    EXPECT_EQ(factory.log->count("released:s1"), 1u);
    EXPECT_EQ(factory.log->count("interrupted:s1"), 1u);

    auto held = inspect("s1");
    ASSERT_TRUE(held.has_value());
    EXPECT_EQ(held->attachment, 0u);
}
