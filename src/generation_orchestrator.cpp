#include "generation_orchestrator.hpp"
#include "util.hpp"

#include <iostream>

namespace genstream {

const char* generation_state_name(GenerationState state) {
    switch (state) {
        case GenerationState::Idle:     return "idle";
        case GenerationState::Starting: return "starting";
        case GenerationState::Active:   return "active";
        case GenerationState::Error:    return "error";
    }
    return "unknown";
}

GenerationOrchestrator::GenerationOrchestrator(EventLoop& loop, ConnectionHub& hub,
                                               FrameRelay& relay, SignalingClient& signaling,
                                               const GenerationApi& api,
                                               OrchestratorOptions options)
    : loop_(loop)
    , hub_(hub)
    , relay_(relay)
    , signaling_(signaling)
    , api_(api)
    , options_(std::move(options))
{
    SignalingHandlers handlers;
    handlers.on_connect = [this]() { on_signaling_connect(); };
    handlers.on_frame = [this](VideoFrame frame) { on_signaling_frame(std::move(frame)); };
    handlers.on_error = [this](const std::string& reason) { on_signaling_error(reason); };
    handlers.on_disconnect = [this](const std::string& reason) { on_signaling_disconnect(reason); };
    signaling_.set_handlers(std::move(handlers));
}

GenerationOrchestrator::~GenerationOrchestrator() {
    signaling_.set_handlers({});
    cancel_timeout();
}

HubSnapshot GenerationOrchestrator::snapshot() const {
    HubSnapshot snap;
    snap.status = state_name();
    snap.has_active_stream = has_active_stream();
    return snap;
}

void GenerationOrchestrator::transition(GenerationState next) {
    if (next == state_) return;
    GenerationState prev = state_;
    state_ = next;
    if (listener_) listener_(prev, next);
}

void GenerationOrchestrator::cancel_timeout() {
    if (!timeout_timer_) return;
    loop_.cancel(*timeout_timer_);
    timeout_timer_.reset();
}

void GenerationOrchestrator::reset() {
    cancel_timeout();
    signaling_.disconnect();
    relay_.stop();
    session_.reset();
    ++token_;
    transition(GenerationState::Idle);
}

void GenerationOrchestrator::fail(const std::string& reason) {
    std::cerr << "[generator] " << reason << "\n";
    transition(GenerationState::Error);
    hub_.broadcast(StreamEvent::text(EventType::Error, reason));
    reset();
}

bool GenerationOrchestrator::request_generation(const std::string& prompt) {
    if (state_ != GenerationState::Idle) {
        std::cerr << "[generator] Generation already in progress, skipping\n";
        return false;
    }
    if (prompt.empty()) {
        std::cerr << "[generator] Ignoring generation request with empty prompt\n";
        return false;
    }

    uint64_t token = ++token_;
    session_ = Session{};
    session_->prompt = prompt;
    transition(GenerationState::Starting);

    timeout_timer_ = loop_.call_later(options_.timeout, [this, token]() { on_timeout(token); });

    hub_.broadcast(StreamEvent::text(EventType::VideoGeneration,
                                     "Starting video generation: \"" + prompt + "\""));
    std::cerr << "[generator] Requesting video generation with prompt: " << prompt << "\n";

    StartRequest request;
    request.prompt = prompt;
    request.quality = options_.quality;
    request.duration = options_.duration;

    // The worker gets its own copy of the client; only the loop and the
    // HttpClient it wraps outlive this object.
    GenerationApi api = api_;
    EventLoop& loop = loop_;
    loop_.offload([this, api, &loop, request, token]() {
        try {
            StartResponse response = api.start(request);
            loop.post([this, token, response]() { on_start_succeeded(token, response); });
        } catch (const std::exception& e) {
            std::string reason = e.what();
            loop.post([this, token, reason]() { on_start_failed(token, reason); });
        }
    });
    return true;
}

void GenerationOrchestrator::on_start_succeeded(uint64_t token, const StartResponse& response) {
    if (token != token_ || state_ != GenerationState::Starting) {
        std::cerr << "[generator] Discarding start response for superseded stream "
                  << response.stream_id << "\n";
        return;
    }
    session_->id = response.stream_id;
    session_->endpoint_url = response.whep_url;
    std::cerr << "[generator] Video generation started. Stream ID: " << response.stream_id
              << ", WHEP URL: " << response.whep_url << "\n";

    hub_.broadcast(StreamEvent::text(EventType::VideoGeneration,
                                     "Video generation initiated. Stream ID: " + response.stream_id));
    signaling_.connect(response.whep_url);
}

void GenerationOrchestrator::on_start_failed(uint64_t token, const std::string& reason) {
    if (token != token_ || state_ != GenerationState::Starting) {
        std::cerr << "[generator] Discarding start failure of a superseded attempt: " << reason << "\n";
        return;
    }
    fail("Video generation failed: " + reason);
}

void GenerationOrchestrator::on_timeout(uint64_t token) {
    if (token != token_) return;
    timeout_timer_.reset();
    if (state_ != GenerationState::Starting) return;
    fail("Video generation timeout after " + std::to_string(options_.timeout.count()) + "ms");
}

void GenerationOrchestrator::on_signaling_connect() {
    if (state_ != GenerationState::Starting || !session_) return;
    cancel_timeout();
    session_->started_at = epoch_millis();
    transition(GenerationState::Active);
    relay_.start(session_->id);

    hub_.broadcast(StreamEvent::text(EventType::VideoGeneration,
                                     "WHEP connection established, receiving video frames"));
    std::cerr << "[generator] Stream " << session_->id << " active\n";
}

void GenerationOrchestrator::on_signaling_frame(VideoFrame frame) {
    if (!session_) return;
    frame.session_id = session_->id;
    relay_.on_frame(frame);
}

void GenerationOrchestrator::on_signaling_error(const std::string& reason) {
    if (state_ == GenerationState::Idle) return;
    fail("WHEP connection error: " + reason);
}

void GenerationOrchestrator::on_signaling_disconnect(const std::string& reason) {
    if (state_ == GenerationState::Idle) return;
    std::cerr << "[generator] WHEP disconnected: " << reason << "\n";
    relay_.stop();
    hub_.broadcast(StreamEvent::text(EventType::VideoGeneration,
                                     "Stream disconnected: " + reason));
    reset();
}

void GenerationOrchestrator::stop_current_generation() {
    bool had_session = session_.has_value();
    reset();
    if (had_session) std::cerr << "[generator] Video generation stopped\n";
}

bool GenerationOrchestrator::check_status() {
    if (!session_ || session_->id.empty()) return false;

    uint64_t token = token_;
    std::string stream_id = session_->id;
    GenerationApi api = api_;
    EventLoop& loop = loop_;
    loop_.offload([this, api, &loop, stream_id, token]() {
        try {
            nlohmann::json status = api.status(stream_id);
            loop.post([this, token, status]() {
                if (token != token_) return;
                std::cerr << "[generator] Stream status check: " << status.dump() << "\n";
                last_status_ = status;
            });
        } catch (const std::exception& e) {
            std::cerr << "[generator] Stream status check failed: " << e.what() << "\n";
        }
    });
    return true;
}

} // namespace genstream
