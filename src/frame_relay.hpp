#pragma once
#include "connection_hub.hpp"
#include "event_loop.hpp"
#include "video_frame.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace genstream {

struct FrameRelayOptions {
    Millis staleness{5000};
    uint32_t target_frame_rate = 30;   // reported in status; frames are never dropped for it
};

// Converts inbound frames into "frame" events and tracks liveness of the
// active session.
class FrameRelay {
public:
    FrameRelay(EventLoop& loop, ConnectionHub& hub, FrameRelayOptions options = {});

    // Accept frames for session_id from now on; resets per-session counters.
    void start(const std::string& session_id);

    // Broadcast a frame event for every in-sequence frame of the active
    // session. Frames for other sessions, frames arriving with no active
    // session and out-of-order sequences are dropped.
    void on_frame(const VideoFrame& frame);

    // Active session and a frame seen within the staleness threshold.
    bool is_live() const;

    // Broadcast a waiting_frame placeholder unless live. Returns true if sent.
    bool send_waiting_frame();

    // Forget the session and liveness state.
    void stop();

    bool active() const { return session_id_.has_value(); }
    uint64_t frames_relayed() const { return frames_relayed_; }
    uint64_t frames_dropped() const { return frames_dropped_; }
    uint32_t target_frame_rate() const { return options_.target_frame_rate; }
    bool has_current_frame() const { return has_current_frame_; }

private:
    EventLoop& loop_;
    ConnectionHub& hub_;
    FrameRelayOptions options_;

    std::optional<std::string> session_id_;
    std::optional<Clock::time_point> last_frame_at_;
    std::optional<uint64_t> last_sequence_;
    uint64_t frames_relayed_ = 0;
    uint64_t frames_dropped_ = 0;
    bool has_current_frame_ = false;
};

} // namespace genstream
