#include <catch2/catch_test_macros.hpp>
#include "generation_orchestrator.hpp"
#include "manual_event_loop.hpp"
#include "mock_http_client.hpp"
#include "mock_peer_transport.hpp"
#include "recording_transport.hpp"

using namespace genstream;

static const char* kStartOk = R"({"stream_id": "stream-1", "whep_url": "http://media:8889/whep/stream-1"})";
static const char* kAnswer = "v=0\nm=video 9 UDP/TLS/RTP/SAVPF 96\na=sendonly\n";

using Transition = std::pair<GenerationState, GenerationState>;

struct OrchestratorFixture {
    ManualLoop loop;
    MockHttpClient api_http;
    MockHttpClient whep_http;
    std::shared_ptr<MockPeerControl> control = std::make_shared<MockPeerControl>();
    ConnectionHub hub;
    FrameRelay relay{loop, hub};
    SignalingClient signaling{loop, whep_http, mock_transport_factory(control)};
    GenerationApi api{api_http, "http://gen:8000"};
    GenerationOrchestrator orch{loop, hub, relay, signaling, api};
    std::shared_ptr<Recording> rec = std::make_shared<Recording>();
    std::vector<Transition> transitions;

    OrchestratorFixture() {
        api_http.next_response = {200, kStartOk};
        whep_http.next_response = {201, kAnswer};
        hub.set_snapshot_provider([this]() { return orch.snapshot(); });
        hub.register_subscriber(recording(rec));
        orch.set_state_listener([this](GenerationState from, GenerationState to) {
            transitions.emplace_back(from, to);
        });
    }

    // Start API answered and offer POSTed; ICE not yet connected.
    void through_handshake(const std::string& prompt = "a neon city") {
        REQUIRE(orch.request_generation(prompt));
        loop.drain();
        REQUIRE(control->current != nullptr);
        control->current->finish_gathering();
        loop.drain();
    }

    void to_active(const std::string& prompt = "a neon city") {
        through_handshake(prompt);
        control->current->set_ice(IceState::Connected);
        REQUIRE(orch.state() == GenerationState::Active);
    }

    std::vector<std::string> contents(const std::string& type) const {
        std::vector<std::string> out;
        for (const auto& j : rec->of_type(type)) out.push_back(j["content"].get<std::string>());
        return out;
    }
};

// ── Happy path ───────────────────────────────────────────────────

TEST_CASE("Orchestrator: starts Idle", "[orchestrator]") {
    OrchestratorFixture f;
    REQUIRE(f.orch.state() == GenerationState::Idle);
    REQUIRE_FALSE(f.orch.session().has_value());
    REQUIRE_FALSE(f.orch.has_active_stream());
    REQUIRE(std::string(f.orch.state_name()) == "idle");
}

TEST_CASE("Orchestrator: request posts prompt, quality and duration", "[orchestrator]") {
    OrchestratorFixture f;
    REQUIRE(f.orch.request_generation("a neon city"));
    REQUIRE(f.orch.state() == GenerationState::Starting);
    REQUIRE(f.orch.session()->prompt == "a neon city");

    f.loop.drain();
    REQUIRE(f.api_http.last_url == "http://gen:8000/ai/stream/start");
    auto body = nlohmann::json::parse(f.api_http.last_body);
    REQUIRE(body["prompt"] == "a neon city");
    REQUIRE(body["quality"] == "high");
    REQUIRE(body["duration"] == 10);
}

TEST_CASE("Orchestrator: full path to Active", "[orchestrator]") {
    OrchestratorFixture f;
    f.to_active();

    REQUIRE(f.orch.has_active_stream());
    REQUIRE(f.orch.session()->id == "stream-1");
    REQUIRE(f.orch.session()->endpoint_url == "http://media:8889/whep/stream-1");
    REQUIRE(f.orch.session()->started_at.has_value());
    REQUIRE(f.relay.active());
    REQUIRE(f.whep_http.last_url == "http://media:8889/whep/stream-1");

    auto status = f.contents("video_generation");
    REQUIRE(status.size() == 3);
    REQUIRE(status[0] == "Starting video generation: \"a neon city\"");
    REQUIRE(status[1] == "Video generation initiated. Stream ID: stream-1");
    REQUIRE(status[2] == "WHEP connection established, receiving video frames");

    REQUIRE(f.transitions == std::vector<Transition>{
        {GenerationState::Idle, GenerationState::Starting},
        {GenerationState::Starting, GenerationState::Active}});
}

TEST_CASE("Orchestrator: reaching Active cancels the timeout", "[orchestrator]") {
    OrchestratorFixture f;
    f.to_active();
    f.loop.advance(Millis(60000));
    REQUIRE(f.orch.state() == GenerationState::Active);
    REQUIRE(f.rec->count_type("error") == 0);
}

TEST_CASE("Orchestrator: frames are stamped and relayed", "[orchestrator]") {
    OrchestratorFixture f;
    f.to_active();
    f.control->current->emit_frame(1);
    f.control->current->emit_frame(2);

    auto frames = f.rec->of_type("frame");
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[0]["data"]["streamId"] == "stream-1");
    REQUIRE(f.relay.is_live());
}

TEST_CASE("Orchestrator: snapshot reflects state for new subscribers", "[orchestrator]") {
    OrchestratorFixture f;
    f.to_active();
    auto late = std::make_shared<Recording>();
    f.hub.register_subscriber(recording(late));
    REQUIRE(late->message(0)["data"]["status"] == "active");
    REQUIRE(late->message(0)["data"]["hasActiveStream"] == true);
}

// ── Single flight ────────────────────────────────────────────────

TEST_CASE("Orchestrator: only the first request is accepted while non-Idle", "[orchestrator]") {
    OrchestratorFixture f;
    REQUIRE(f.orch.request_generation("first"));
    REQUIRE_FALSE(f.orch.request_generation("second"));
    REQUIRE_FALSE(f.orch.request_generation("third"));
    f.loop.drain();
    REQUIRE(f.api_http.call_count == 1);

    f.control->current->finish_gathering();
    f.loop.drain();
    f.control->current->set_ice(IceState::Connected);
    REQUIRE_FALSE(f.orch.request_generation("fourth"));
    REQUIRE(f.orch.session()->prompt == "first");

    f.orch.stop_current_generation();
    REQUIRE(f.orch.request_generation("fifth"));
}

TEST_CASE("Orchestrator: empty prompt is rejected", "[orchestrator]") {
    OrchestratorFixture f;
    REQUIRE_FALSE(f.orch.request_generation(""));
    REQUIRE(f.orch.state() == GenerationState::Idle);
    REQUIRE(f.loop.pending_offloads() == 0);
}

// ── Failures ─────────────────────────────────────────────────────

TEST_CASE("Orchestrator: start API error goes Error then Idle", "[orchestrator]") {
    OrchestratorFixture f;
    f.api_http.next_response = {503, "busy"};
    REQUIRE(f.orch.request_generation("p"));
    f.loop.drain();

    REQUIRE(f.orch.state() == GenerationState::Idle);
    REQUIRE_FALSE(f.orch.session().has_value());
    auto errors = f.contents("error");
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0] == "Video generation failed: Video API responded with status: 503");
    REQUIRE(f.transitions == std::vector<Transition>{
        {GenerationState::Idle, GenerationState::Starting},
        {GenerationState::Starting, GenerationState::Error},
        {GenerationState::Error, GenerationState::Idle}});
}

TEST_CASE("Orchestrator: unreachable API and malformed body fail the attempt", "[orchestrator]") {
    OrchestratorFixture f;
    f.api_http.response_queue = {{0, ""}, {200, "not json"}, {200, R"({"stream_id": "x"})"}};

    for (int i = 0; i < 3; ++i) {
        REQUIRE(f.orch.request_generation("p"));
        f.loop.drain();
        REQUIRE(f.orch.state() == GenerationState::Idle);
    }
    REQUIRE(f.rec->count_type("error") == 3);
    REQUIRE(f.control->created == 0);
}

TEST_CASE("Orchestrator: timeout fires exactly at the configured deadline", "[orchestrator]") {
    OrchestratorFixture f;
    f.through_handshake();   // ICE never connects

    f.loop.advance(Millis(9999));
    REQUIRE(f.orch.state() == GenerationState::Starting);
    REQUIRE(f.rec->count_type("error") == 0);

    f.loop.advance(Millis(1));
    REQUIRE(f.orch.state() == GenerationState::Idle);
    auto errors = f.contents("error");
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0] == "Video generation timeout after 10000ms");
    REQUIRE(f.transitions.back() == Transition{GenerationState::Error, GenerationState::Idle});
    REQUIRE_FALSE(f.signaling.has_session());

    f.loop.advance(Millis(60000));
    REQUIRE(f.rec->count_type("error") == 1);
}

TEST_CASE("Orchestrator: custom timeout", "[orchestrator]") {
    ManualLoop loop;
    MockHttpClient http;
    auto control = std::make_shared<MockPeerControl>();
    ConnectionHub hub;
    FrameRelay relay(loop, hub);
    SignalingClient signaling(loop, http, mock_transport_factory(control));
    GenerationApi api(http, "http://gen");
    OrchestratorOptions opts;
    opts.timeout = Millis(2500);
    GenerationOrchestrator orch(loop, hub, relay, signaling, api, opts);

    REQUIRE(orch.request_generation("p"));   // start call left in flight
    loop.advance(Millis(2499));
    REQUIRE(orch.state() == GenerationState::Starting);
    loop.advance(Millis(1));
    REQUIRE(orch.state() == GenerationState::Idle);
    REQUIRE(hub.history().back().content == "Video generation timeout after 2500ms");
}

TEST_CASE("Orchestrator: handshake failure goes Error then Idle", "[orchestrator]") {
    OrchestratorFixture f;
    f.whep_http.next_response = {500, "boom"};
    f.through_handshake();

    REQUIRE(f.orch.state() == GenerationState::Idle);
    auto errors = f.contents("error");
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0] == "WHEP connection error: WHEP handshake failed: HTTP 500");

    f.loop.advance(Millis(20000));   // the timeout was cancelled with the session
    REQUIRE(f.rec->count_type("error") == 1);
}

TEST_CASE("Orchestrator: disconnect from Active returns to Idle", "[orchestrator]") {
    OrchestratorFixture f;
    f.to_active();
    f.control->current->set_ice(IceState::Disconnected);

    REQUIRE(f.orch.state() == GenerationState::Idle);
    REQUIRE_FALSE(f.relay.active());
    REQUIRE(f.contents("video_generation").back() == "Stream disconnected: disconnected");
    REQUIRE(f.rec->count_type("error") == 0);
    REQUIRE(f.transitions.back() == Transition{GenerationState::Active, GenerationState::Idle});
}

// ── Stop and stale results ───────────────────────────────────────

TEST_CASE("Orchestrator: stop while the start call is in flight discards the result", "[orchestrator]") {
    OrchestratorFixture f;
    REQUIRE(f.orch.request_generation("p"));
    f.orch.stop_current_generation();
    REQUIRE(f.orch.state() == GenerationState::Idle);

    f.loop.drain();   // API answers successfully, too late
    REQUIRE(f.orch.state() == GenerationState::Idle);
    REQUIRE_FALSE(f.orch.session().has_value());
    REQUIRE(f.control->created == 0);
    REQUIRE(f.contents("video_generation").size() == 1);
}

TEST_CASE("Orchestrator: a stale start result cannot hijack a newer attempt", "[orchestrator]") {
    OrchestratorFixture f;
    f.api_http.response_queue = {
        {200, R"({"stream_id": "old", "whep_url": "http://media/whep/old"})"},
        {200, R"({"stream_id": "new", "whep_url": "http://media/whep/new"})"}};

    REQUIRE(f.orch.request_generation("first"));
    f.orch.stop_current_generation();
    REQUIRE(f.orch.request_generation("second"));
    f.loop.drain();

    REQUIRE(f.orch.state() == GenerationState::Starting);
    REQUIRE(f.orch.session()->prompt == "second");
    REQUIRE(f.orch.session()->id == "new");
    REQUIRE(f.control->created == 1);
}

TEST_CASE("Orchestrator: stop from Active tears everything down", "[orchestrator]") {
    OrchestratorFixture f;
    f.to_active();
    f.orch.stop_current_generation();

    REQUIRE(f.orch.state() == GenerationState::Idle);
    REQUIRE_FALSE(f.orch.session().has_value());
    REQUIRE_FALSE(f.signaling.has_session());
    REQUIRE_FALSE(f.relay.active());
    REQUIRE(f.control->closed == 1);
}

TEST_CASE("Orchestrator: stop is idempotent", "[orchestrator]") {
    OrchestratorFixture f;
    f.orch.stop_current_generation();
    f.orch.stop_current_generation();
    f.orch.shutdown();
    REQUIRE(f.orch.state() == GenerationState::Idle);
    REQUIRE(f.transitions.empty());
}

TEST_CASE("Orchestrator: stop cancels the pending timeout", "[orchestrator]") {
    OrchestratorFixture f;
    f.through_handshake();
    f.orch.stop_current_generation();
    f.loop.advance(Millis(20000));
    REQUIRE(f.rec->count_type("error") == 0);
    REQUIRE(f.loop.pending_timers() == 0);
}

// ── Status polling ───────────────────────────────────────────────

TEST_CASE("Orchestrator: check_status needs a stream id", "[orchestrator]") {
    OrchestratorFixture f;
    REQUIRE_FALSE(f.orch.check_status());
    REQUIRE(f.orch.request_generation("p"));
    REQUIRE_FALSE(f.orch.check_status());   // start call still in flight
}

TEST_CASE("Orchestrator: check_status caches the result", "[orchestrator]") {
    OrchestratorFixture f;
    f.to_active();
    f.api_http.next_response = {200, R"({"state": "running", "frames": 120})"};

    REQUIRE(f.orch.check_status());
    f.loop.drain();
    REQUIRE(f.api_http.last_method == "GET");
    REQUIRE(f.api_http.last_url == "http://gen:8000/ai/stream/stream-1/status");
    REQUIRE(f.orch.last_status().has_value());
    REQUIRE((*f.orch.last_status())["state"] == "running");
}

TEST_CASE("Orchestrator: status failure changes nothing", "[orchestrator]") {
    OrchestratorFixture f;
    f.to_active();
    f.api_http.next_response = {500, ""};
    REQUIRE(f.orch.check_status());
    f.loop.drain();
    REQUIRE(f.orch.state() == GenerationState::Active);
    REQUIRE(f.rec->count_type("error") == 0);
    REQUIRE_FALSE(f.orch.last_status().has_value());
}
