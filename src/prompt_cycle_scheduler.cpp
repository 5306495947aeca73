#include "prompt_cycle_scheduler.hpp"

#include <iostream>

namespace genstream {

PromptCycleScheduler::PromptCycleScheduler(EventLoop& loop, ConnectionHub& hub, FrameRelay& relay,
                                           GenerationOrchestrator& orchestrator,
                                           std::unique_ptr<TextGenerator> thoughts,
                                           std::unique_ptr<TextGenerator> prompts,
                                           CycleTiming timing)
    : loop_(loop)
    , hub_(hub)
    , relay_(relay)
    , orchestrator_(orchestrator)
    , thoughts_(std::move(thoughts))
    , prompts_(std::move(prompts))
    , timing_(timing)
{}

PromptCycleScheduler::~PromptCycleScheduler() {
    stop();
}

void PromptCycleScheduler::start() {
    if (running_) return;
    running_ = true;
    ++epoch_;
    std::cerr << "[cycle] Starting prompt cycle (every " << timing_.interval.count() << "ms)\n";

    schedule(timing_.initial_delay, [this]() { run_cycle(); });
    schedule(timing_.interval, [this]() { tick(); });
}

void PromptCycleScheduler::stop() {
    if (!running_) return;
    running_ = false;
    ++epoch_;
    for (const auto& [key, id] : pending_)
        loop_.cancel(id);
    pending_.clear();
    std::cerr << "[cycle] Prompt cycle stopped\n";
}

void PromptCycleScheduler::schedule(Millis delay, Task task) {
    uint64_t key = ++next_key_;
    uint64_t epoch = epoch_;
    TimerId id = loop_.call_later(delay, [this, key, epoch, task = std::move(task)]() {
        pending_.erase(key);
        if (epoch != epoch_) return;
        task();
    });
    pending_[key] = id;
}

void PromptCycleScheduler::tick() {
    schedule(timing_.interval, [this]() { tick(); });
    run_cycle();
}

void PromptCycleScheduler::report_failure(const char* stage, const std::exception& e) {
    std::cerr << "[cycle] Error generating " << stage << ": " << e.what() << "\n";
    hub_.broadcast(StreamEvent::text(EventType::Error, "LLM processing error occurred"));
}

void PromptCycleScheduler::run_cycle() {
    ++cycles_;
    std::string thought;
    try {
        thought = thoughts_->generate();
    } catch (const std::exception& e) {
        report_failure("thought", e);
        return;
    }
    hub_.broadcast(StreamEvent::text(EventType::Thought, thought));
    std::cerr << "[cycle] Thought: " << thought << "\n";

    schedule(timing_.prompt_delay, [this]() { publish_prompt(); });
}

void PromptCycleScheduler::publish_prompt() {
    std::string prompt;
    try {
        prompt = prompts_->generate();
    } catch (const std::exception& e) {
        report_failure("prompt", e);
        return;
    }
    last_prompt_ = prompt;
    hub_.broadcast(StreamEvent::text(EventType::Prompt, prompt));
    std::cerr << "[cycle] Prompt: " << prompt << "\n";

    schedule(timing_.trigger_delay, [this, prompt]() { trigger(prompt); });
}

void PromptCycleScheduler::trigger(const std::string& prompt) {
    if (relay_.is_live()) return;
    orchestrator_.request_generation(prompt);
}

} // namespace genstream
