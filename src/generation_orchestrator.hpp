#pragma once
#include "connection_hub.hpp"
#include "event_loop.hpp"
#include "frame_relay.hpp"
#include "generation_api.hpp"
#include "signaling_client.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace genstream {

enum class GenerationState { Idle, Starting, Active, Error };

const char* generation_state_name(GenerationState state);

// The single generation attempt. Exists whenever the state is not Idle.
struct Session {
    std::string id;              // stream id assigned by the generation API
    std::string endpoint_url;    // WHEP URL for this stream
    std::string prompt;
    std::optional<int64_t> started_at; // epoch ms, set on entering Active
};

struct OrchestratorOptions {
    Millis timeout{10000};
    std::string quality = "high";
    uint32_t duration = 10;
};

// Owns the stream lifecycle:
//   Idle → Starting → Active → Idle
//   Starting → Error → Idle,  Active → Error → Idle,  Active → Idle
// At most one attempt is in flight; async results carry the token of the
// attempt that issued them and are dropped once it has been superseded.
class GenerationOrchestrator {
public:
    using StateListener = std::function<void(GenerationState from, GenerationState to)>;

    GenerationOrchestrator(EventLoop& loop, ConnectionHub& hub, FrameRelay& relay,
                           SignalingClient& signaling, const GenerationApi& api,
                           OrchestratorOptions options = {});
    ~GenerationOrchestrator();

    GenerationOrchestrator(const GenerationOrchestrator&) = delete;
    GenerationOrchestrator& operator=(const GenerationOrchestrator&) = delete;

    // Begin a generation unless one is already in flight. Returns false
    // (and does nothing) when not Idle or when the prompt is empty.
    bool request_generation(const std::string& prompt);

    // Abandon the current attempt, if any. Idempotent.
    void stop_current_generation();

    // Poll the status API for the current stream. Advisory: the result is
    // logged and cached, failures never change state. Returns false when
    // there is no stream to ask about.
    bool check_status();

    // Process teardown.
    void shutdown() { stop_current_generation(); }

    GenerationState state() const { return state_; }
    const char* state_name() const { return generation_state_name(state_); }
    const std::optional<Session>& session() const { return session_; }
    bool has_active_stream() const { return state_ == GenerationState::Active; }
    const std::optional<nlohmann::json>& last_status() const { return last_status_; }
    HubSnapshot snapshot() const;

    void set_state_listener(StateListener listener) { listener_ = std::move(listener); }

private:
    void transition(GenerationState next);
    void fail(const std::string& reason);
    void reset();
    void cancel_timeout();

    void on_start_succeeded(uint64_t token, const StartResponse& response);
    void on_start_failed(uint64_t token, const std::string& reason);
    void on_timeout(uint64_t token);

    void on_signaling_connect();
    void on_signaling_frame(VideoFrame frame);
    void on_signaling_error(const std::string& reason);
    void on_signaling_disconnect(const std::string& reason);

    EventLoop& loop_;
    ConnectionHub& hub_;
    FrameRelay& relay_;
    SignalingClient& signaling_;
    const GenerationApi& api_;
    OrchestratorOptions options_;
    StateListener listener_;

    GenerationState state_ = GenerationState::Idle;
    std::optional<Session> session_;
    uint64_t token_ = 0;
    std::optional<TimerId> timeout_timer_;
    std::optional<nlohmann::json> last_status_;
};

} // namespace genstream
