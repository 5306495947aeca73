#include <catch2/catch_test_macros.hpp>
#include "prompt_cycle_scheduler.hpp"
#include "manual_event_loop.hpp"
#include "mock_http_client.hpp"
#include "mock_peer_transport.hpp"
#include "recording_transport.hpp"
#include <deque>
#include <set>
#include <stdexcept>

using namespace genstream;

// Returns scripted lines in order; an empty string throws instead.
class ScriptedGenerator : public TextGenerator {
public:
    explicit ScriptedGenerator(std::deque<std::string> lines) : lines_(std::move(lines)) {}

    std::string generate() override {
        ++calls;
        std::string next = lines_.empty() ? "fallback" : lines_.front();
        if (!lines_.empty()) lines_.pop_front();
        if (next.empty()) throw std::runtime_error("model overloaded");
        return next;
    }

    int calls = 0;

private:
    std::deque<std::string> lines_;
};

struct SchedulerFixture {
    ManualLoop loop;
    MockHttpClient http;
    std::shared_ptr<MockPeerControl> control = std::make_shared<MockPeerControl>();
    ConnectionHub hub;
    FrameRelay relay{loop, hub};
    SignalingClient signaling{loop, http, mock_transport_factory(control)};
    GenerationApi api{http, "http://gen"};
    GenerationOrchestrator orch{loop, hub, relay, signaling, api};
    std::shared_ptr<Recording> rec = std::make_shared<Recording>();
    ScriptedGenerator* thoughts = nullptr;
    ScriptedGenerator* prompts = nullptr;
    std::unique_ptr<PromptCycleScheduler> scheduler;

    explicit SchedulerFixture(std::deque<std::string> thought_lines = {"thinking..."},
                              std::deque<std::string> prompt_lines = {"a quiet forest"}) {
        auto t = std::make_unique<ScriptedGenerator>(std::move(thought_lines));
        auto p = std::make_unique<ScriptedGenerator>(std::move(prompt_lines));
        thoughts = t.get();
        prompts = p.get();
        scheduler = std::make_unique<PromptCycleScheduler>(loop, hub, relay, orch,
                                                           std::move(t), std::move(p));
        hub.register_subscriber(recording(rec));
    }

    void feed_live_frame(const std::string& stream, uint64_t seq) {
        VideoFrame f;
        f.session_id = stream;
        f.sequence = seq;
        f.payload = {1};
        relay.on_frame(f);
    }
};

// ── Timing ───────────────────────────────────────────────────────

TEST_CASE("Scheduler: thought, prompt, trigger spaced by the configured delays", "[scheduler]") {
    SchedulerFixture f;
    f.scheduler->start();
    REQUIRE(f.scheduler->running());

    f.loop.advance(Millis(999));
    REQUIRE(f.rec->count_type("thought") == 0);

    f.loop.advance(Millis(1));
    REQUIRE(f.rec->count_type("thought") == 1);
    REQUIRE(f.rec->of_type("thought")[0]["content"] == "thinking...");
    REQUIRE(f.rec->count_type("prompt") == 0);

    f.loop.advance(Millis(2000));
    REQUIRE(f.rec->count_type("prompt") == 1);
    REQUIRE(f.rec->of_type("prompt")[0]["content"] == "a quiet forest");
    REQUIRE(f.scheduler->last_prompt() == "a quiet forest");
    REQUIRE(f.orch.state() == GenerationState::Idle);

    f.loop.advance(Millis(2000));
    REQUIRE(f.orch.state() == GenerationState::Starting);
    REQUIRE(f.orch.session()->prompt == "a quiet forest");
}

TEST_CASE("Scheduler: cycles repeat on the interval", "[scheduler]") {
    SchedulerFixture f;
    f.scheduler->start();
    f.loop.advance(Millis(1000));
    REQUIRE(f.scheduler->cycles() == 1);
    f.loop.advance(Millis(6000));    // t = 7000
    REQUIRE(f.scheduler->cycles() == 2);
    f.loop.advance(Millis(7000));    // t = 14000
    REQUIRE(f.scheduler->cycles() == 3);
    REQUIRE(f.thoughts->calls == 3);
}

TEST_CASE("Scheduler: custom timing", "[scheduler]") {
    ManualLoop loop;
    MockHttpClient http;
    ConnectionHub hub;
    FrameRelay relay(loop, hub);
    SignalingClient signaling(loop, http, mock_transport_factory(std::make_shared<MockPeerControl>()));
    GenerationApi api(http, "http://gen");
    GenerationOrchestrator orch(loop, hub, relay, signaling, api);

    CycleTiming timing;
    timing.initial_delay = Millis(10);
    timing.interval = Millis(100);
    timing.prompt_delay = Millis(20);
    timing.trigger_delay = Millis(30);
    PromptCycleScheduler scheduler(loop, hub, relay, orch,
                                   std::make_unique<ThoughtPatterns>(1),
                                   std::make_unique<TemplatePromptGenerator>(2), timing);
    scheduler.start();

    loop.advance(Millis(59));
    REQUIRE(orch.state() == GenerationState::Idle);
    loop.advance(Millis(1));
    REQUIRE(orch.state() == GenerationState::Starting);
}

TEST_CASE("Scheduler: start twice does not double the cadence", "[scheduler]") {
    SchedulerFixture f;
    f.scheduler->start();
    f.scheduler->start();
    f.loop.advance(Millis(1000));
    REQUIRE(f.scheduler->cycles() == 1);
}

// ── Trigger gating ───────────────────────────────────────────────

TEST_CASE("Scheduler: no generation while frames are flowing", "[scheduler]") {
    SchedulerFixture f;
    f.relay.start("live-stream");
    f.scheduler->start();

    f.loop.advance(Millis(4000));
    f.feed_live_frame("live-stream", 1);
    f.loop.advance(Millis(1000));    // trigger at t = 5000

    REQUIRE(f.rec->count_type("prompt") == 1);
    REQUIRE(f.orch.state() == GenerationState::Idle);
    REQUIRE(f.loop.pending_offloads() == 0);
}

TEST_CASE("Scheduler: stale frames no longer block generation", "[scheduler]") {
    SchedulerFixture f;
    f.relay.start("old-stream");
    f.feed_live_frame("old-stream", 1);   // t = 0, stale by t = 5000
    f.scheduler->start();

    f.loop.advance(Millis(5000));
    REQUIRE_FALSE(f.relay.is_live());
    REQUIRE(f.orch.state() == GenerationState::Starting);
}

TEST_CASE("Scheduler: a cycle during an attempt does not start another", "[scheduler]") {
    SchedulerFixture f({"t1", "t2"}, {"p1", "p2"});
    f.scheduler->start();
    f.loop.advance(Millis(5000));
    REQUIRE(f.orch.state() == GenerationState::Starting);   // start call left in flight

    f.loop.advance(Millis(6000));    // second cycle triggers at t = 11000; timeout at 15000
    REQUIRE(f.orch.session()->prompt == "p1");
    REQUIRE(f.loop.pending_offloads() == 1);
}

// ── Stop ─────────────────────────────────────────────────────────

TEST_CASE("Scheduler: stop prevents pending prompt and trigger", "[scheduler]") {
    SchedulerFixture f;
    f.scheduler->start();
    f.loop.advance(Millis(1000));
    REQUIRE(f.rec->count_type("thought") == 1);

    f.scheduler->stop();
    REQUIRE_FALSE(f.scheduler->running());
    REQUIRE(f.loop.pending_timers() == 0);

    f.loop.advance(Millis(30000));
    REQUIRE(f.rec->count_type("prompt") == 0);
    REQUIRE(f.orch.state() == GenerationState::Idle);
}

TEST_CASE("Scheduler: stop is idempotent and restart resumes", "[scheduler]") {
    SchedulerFixture f;
    f.scheduler->stop();
    f.scheduler->start();
    f.scheduler->stop();
    f.scheduler->stop();
    f.loop.advance(Millis(20000));
    REQUIRE(f.scheduler->cycles() == 0);

    f.scheduler->start();
    f.loop.advance(Millis(1000));
    REQUIRE(f.scheduler->cycles() == 1);
}

// ── Generator failures ───────────────────────────────────────────

TEST_CASE("Scheduler: thought failure reports an error and skips the cycle", "[scheduler]") {
    SchedulerFixture f({"", "recovered"}, {"p"});
    f.scheduler->start();
    f.loop.advance(Millis(5000));

    REQUIRE(f.rec->count_type("thought") == 0);
    REQUIRE(f.rec->count_type("prompt") == 0);
    auto errors = f.rec->of_type("error");
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0]["content"] == "LLM processing error occurred");
    REQUIRE(f.orch.state() == GenerationState::Idle);

    f.loop.advance(Millis(2000));    // next cycle at t = 7000
    REQUIRE(f.rec->count_type("thought") == 1);
}

TEST_CASE("Scheduler: prompt failure reports an error and skips the trigger", "[scheduler]") {
    SchedulerFixture f({"t"}, {""});
    f.scheduler->start();
    f.loop.advance(Millis(6000));

    REQUIRE(f.rec->count_type("thought") == 1);
    REQUIRE(f.rec->count_type("prompt") == 0);
    REQUIRE(f.rec->count_type("error") == 1);
    REQUIRE(f.orch.state() == GenerationState::Idle);
    REQUIRE(f.scheduler->running());
}

// ── Generators ───────────────────────────────────────────────────

TEST_CASE("ThoughtPatterns: picks from its list", "[generators]") {
    ThoughtPatterns thoughts(42);
    REQUIRE(thoughts.patterns().size() == 8);
    std::set<std::string> allowed(thoughts.patterns().begin(), thoughts.patterns().end());
    for (int i = 0; i < 50; ++i)
        REQUIRE(allowed.count(thoughts.generate()) == 1);
}

TEST_CASE("ThoughtPatterns: same seed, same sequence", "[generators]") {
    ThoughtPatterns a(7), b(7);
    for (int i = 0; i < 20; ++i)
        REQUIRE(a.generate() == b.generate());
}

TEST_CASE("ThoughtPatterns: custom list and empty list", "[generators]") {
    ThoughtPatterns only({"just this"}, 3);
    REQUIRE(only.generate() == "just this");
    REQUIRE_THROWS_AS(ThoughtPatterns(std::vector<std::string>{}, 3), std::runtime_error);
}

TEST_CASE("TemplatePromptGenerator: fills every placeholder", "[generators]") {
    TemplatePromptGenerator prompts(99);
    for (int i = 0; i < 50; ++i) {
        std::string p = prompts.generate();
        REQUIRE_FALSE(p.empty());
        REQUIRE(p.find('{') == std::string::npos);
        REQUIRE(p.find('}') == std::string::npos);
    }
}

TEST_CASE("TemplatePromptGenerator: same seed, same prompts", "[generators]") {
    TemplatePromptGenerator a(5), b(5);
    for (int i = 0; i < 20; ++i)
        REQUIRE(a.generate() == b.generate());
}
