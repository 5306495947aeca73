#include <catch2/catch_test_macros.hpp>
#include "frame_relay.hpp"
#include "frame_pipeline.hpp"
#include "manual_event_loop.hpp"
#include "recording_transport.hpp"

using namespace genstream;

static VideoFrame frame(const std::string& session, uint64_t seq,
                        std::vector<uint8_t> payload = {'a', 'b', 'c'}) {
    VideoFrame f;
    f.session_id = session;
    f.sequence = seq;
    f.captured_at = 1700000000000 + static_cast<int64_t>(seq);
    f.width = 640;
    f.height = 360;
    f.payload = std::move(payload);
    return f;
}

struct RelayFixture {
    ManualLoop loop;
    ConnectionHub hub;
    std::shared_ptr<Recording> rec = std::make_shared<Recording>();
    FrameRelay relay;

    explicit RelayFixture(FrameRelayOptions opts = {}) : relay(loop, hub, opts) {
        hub.register_subscriber(recording(rec));
    }
};

TEST_CASE("FrameRelay: frames are ignored without an active session", "[relay]") {
    RelayFixture f;
    f.relay.on_frame(frame("s1", 1));
    REQUIRE(f.rec->count_type("frame") == 0);
    REQUIRE_FALSE(f.relay.is_live());
}

TEST_CASE("FrameRelay: frame event carries sequence, size and base64 payload", "[relay]") {
    RelayFixture f;
    f.relay.start("s1");
    f.relay.on_frame(frame("s1", 7));

    auto frames = f.rec->of_type("frame");
    REQUIRE(frames.size() == 1);
    auto d = frames[0]["data"];
    REQUIRE(d["streamId"] == "s1");
    REQUIRE(d["frameNumber"] == 1);
    REQUIRE(d["sequence"] == 7);
    REQUIRE(d["width"] == 640);
    REQUIRE(d["height"] == 360);
    REQUIRE(d["capturedAt"] == 1700000000007);
    REQUIRE(d["frameData"] == "YWJj");
    REQUIRE(f.relay.frames_relayed() == 1);
    REQUIRE(f.relay.has_current_frame());
}

TEST_CASE("FrameRelay: frames are not kept in history", "[relay]") {
    RelayFixture f;
    f.relay.start("s1");
    f.relay.on_frame(frame("s1", 1));
    REQUIRE(f.hub.history().empty());
}

TEST_CASE("FrameRelay: frames from another session are dropped", "[relay]") {
    RelayFixture f;
    f.relay.start("new");
    f.relay.on_frame(frame("old", 1));
    REQUIRE(f.rec->count_type("frame") == 0);
    REQUIRE_FALSE(f.relay.is_live());
}

TEST_CASE("FrameRelay: sequence must strictly increase", "[relay]") {
    RelayFixture f;
    f.relay.start("s1");
    f.relay.on_frame(frame("s1", 5));
    f.loop.advance(Millis(100));
    f.relay.on_frame(frame("s1", 5));
    f.relay.on_frame(frame("s1", 3));
    f.loop.advance(Millis(100));
    f.relay.on_frame(frame("s1", 6));

    auto frames = f.rec->of_type("frame");
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[1]["data"]["sequence"] == 6);
    REQUIRE(frames[1]["data"]["frameNumber"] == 2);
    REQUIRE(f.relay.frames_dropped() == 2);
}

TEST_CASE("FrameRelay: liveness boundary is exact", "[relay]") {
    RelayFixture f;
    f.relay.start("s1");
    REQUIRE_FALSE(f.relay.is_live());  // no frame yet

    f.relay.on_frame(frame("s1", 1));
    REQUIRE(f.relay.is_live());

    f.loop.advance(Millis(4999));
    REQUIRE(f.relay.is_live());

    f.loop.advance(Millis(1));
    REQUIRE_FALSE(f.relay.is_live());
}

TEST_CASE("FrameRelay: custom staleness threshold", "[relay]") {
    FrameRelayOptions opts;
    opts.staleness = Millis(200);
    RelayFixture f(opts);
    f.relay.start("s1");
    f.relay.on_frame(frame("s1", 1));
    f.loop.advance(Millis(199));
    REQUIRE(f.relay.is_live());
    f.loop.advance(Millis(1));
    REQUIRE_FALSE(f.relay.is_live());
}

TEST_CASE("FrameRelay: every in-sequence frame is broadcast at video rates", "[relay]") {
    FrameRelayOptions opts;
    opts.target_frame_rate = 30;
    RelayFixture f(opts);
    f.relay.start("s1");

    // Just under 30fps on average, with every other gap shorter than 1000/30 ms.
    for (uint64_t seq = 1; seq <= 60; ++seq) {
        f.relay.on_frame(frame("s1", seq));
        f.loop.advance(Millis(seq % 2 ? 32 : 35));
    }

    auto frames = f.rec->of_type("frame");
    REQUIRE(frames.size() == 60);
    for (size_t i = 0; i < frames.size(); ++i) {
        REQUIRE(frames[i]["data"]["sequence"] == i + 1);
        REQUIRE(frames[i]["data"]["frameNumber"] == i + 1);
    }
    REQUIRE(f.relay.frames_relayed() == 60);
    REQUIRE(f.relay.frames_dropped() == 0);
    REQUIRE(f.relay.target_frame_rate() == 30);
}

TEST_CASE("FrameRelay: waiting frame only while not live", "[relay]") {
    RelayFixture f;
    REQUIRE(f.relay.send_waiting_frame());
    auto waiting = f.rec->of_type("waiting_frame");
    REQUIRE(waiting.size() == 1);
    REQUIRE(waiting[0]["data"]["message"] == "Waiting for video frames...");
    REQUIRE(waiting[0]["data"].contains("timestamp"));

    f.relay.start("s1");
    f.relay.on_frame(frame("s1", 1));
    REQUIRE_FALSE(f.relay.send_waiting_frame());
    REQUIRE(f.rec->count_type("waiting_frame") == 1);

    f.loop.advance(Millis(5000));
    REQUIRE(f.relay.send_waiting_frame());
    REQUIRE(f.rec->count_type("waiting_frame") == 2);
}

TEST_CASE("FrameRelay: stop clears session and liveness", "[relay]") {
    RelayFixture f;
    f.relay.start("s1");
    f.relay.on_frame(frame("s1", 1));
    f.relay.stop();

    REQUIRE_FALSE(f.relay.active());
    REQUIRE_FALSE(f.relay.is_live());
    REQUIRE_FALSE(f.relay.has_current_frame());
    f.relay.on_frame(frame("s1", 2));
    REQUIRE(f.rec->count_type("frame") == 1);
}

TEST_CASE("FrameRelay: restart resets counters and sequence tracking", "[relay]") {
    RelayFixture f;
    f.relay.start("s1");
    f.relay.on_frame(frame("s1", 50));
    f.relay.start("s2");
    f.relay.on_frame(frame("s2", 1));

    auto frames = f.rec->of_type("frame");
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[1]["data"]["streamId"] == "s2");
    REQUIRE(frames[1]["data"]["frameNumber"] == 1);
}

// ── PassthroughPipeline ──────────────────────────────────────────

TEST_CASE("PassthroughPipeline: numbers units and copies bytes", "[relay]") {
    PassthroughPipeline pipeline(1280, 720);
    const uint8_t unit[] = {0, 0, 0, 1, 0x65};

    auto a = pipeline.process(unit, sizeof(unit), 9000);
    auto b = pipeline.process(unit, sizeof(unit), 12000);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(b->sequence == a->sequence + 1);
    REQUIRE(a->width == 1280);
    REQUIRE(a->height == 720);
    REQUIRE(a->payload == std::vector<uint8_t>(unit, unit + sizeof(unit)));
    REQUIRE(a->session_id.empty());
}

TEST_CASE("PassthroughPipeline: empty unit yields no frame", "[relay]") {
    PassthroughPipeline pipeline(1, 1);
    REQUIRE_FALSE(pipeline.process(nullptr, 0, 0).has_value());
}
