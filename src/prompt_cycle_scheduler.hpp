#pragma once
#include "connection_hub.hpp"
#include "event_loop.hpp"
#include "frame_relay.hpp"
#include "generation_orchestrator.hpp"
#include "prompt_generator.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace genstream {

struct CycleTiming {
    Millis initial_delay{1000};
    Millis interval{7000};
    Millis prompt_delay{2000};
    Millis trigger_delay{2000};
};

// Periodic "thinking" loop. Each cycle publishes a thought, then a prompt,
// then asks for a new generation if no frames are flowing.
class PromptCycleScheduler {
public:
    PromptCycleScheduler(EventLoop& loop, ConnectionHub& hub, FrameRelay& relay,
                         GenerationOrchestrator& orchestrator,
                         std::unique_ptr<TextGenerator> thoughts,
                         std::unique_ptr<TextGenerator> prompts,
                         CycleTiming timing = {});
    ~PromptCycleScheduler();

    PromptCycleScheduler(const PromptCycleScheduler&) = delete;
    PromptCycleScheduler& operator=(const PromptCycleScheduler&) = delete;

    void start();

    // Cancel every pending timer. Callbacks already queued by an earlier
    // start() see a stale epoch and do nothing. Idempotent.
    void stop();

    bool running() const { return running_; }
    uint64_t cycles() const { return cycles_; }
    const std::string& last_prompt() const { return last_prompt_; }

private:
    void schedule(Millis delay, Task task);
    void tick();
    void run_cycle();
    void publish_prompt();
    void trigger(const std::string& prompt);
    void report_failure(const char* stage, const std::exception& e);

    EventLoop& loop_;
    ConnectionHub& hub_;
    FrameRelay& relay_;
    GenerationOrchestrator& orchestrator_;
    std::unique_ptr<TextGenerator> thoughts_;
    std::unique_ptr<TextGenerator> prompts_;
    CycleTiming timing_;

    bool running_ = false;
    uint64_t epoch_ = 0;
    uint64_t next_key_ = 0;
    std::map<uint64_t, TimerId> pending_;
    uint64_t cycles_ = 0;
    std::string last_prompt_;
};

} // namespace genstream
