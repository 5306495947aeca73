#include "frame_relay.hpp"
#include "util.hpp"

#include <iostream>

namespace genstream {

FrameRelay::FrameRelay(EventLoop& loop, ConnectionHub& hub, FrameRelayOptions options)
    : loop_(loop), hub_(hub), options_(options)
{}

void FrameRelay::start(const std::string& session_id) {
    session_id_ = session_id;
    last_frame_at_.reset();
    last_sequence_.reset();
    frames_relayed_ = 0;
    frames_dropped_ = 0;
    std::cerr << "[relay] Started receiving frames for stream: " << session_id << "\n";
}

void FrameRelay::on_frame(const VideoFrame& frame) {
    if (!session_id_ || frame.session_id != *session_id_) return;
    if (last_sequence_ && frame.sequence <= *last_sequence_) {
        ++frames_dropped_;
        return;
    }
    last_sequence_ = frame.sequence;

    last_frame_at_ = loop_.now();
    ++frames_relayed_;
    has_current_frame_ = !frame.payload.empty();

    hub_.broadcast(StreamEvent::data(EventType::Frame, {
        {"streamId", *session_id_},
        {"frameNumber", frames_relayed_},
        {"sequence", frame.sequence},
        {"timestamp", epoch_millis()},
        {"capturedAt", frame.captured_at},
        {"width", frame.width},
        {"height", frame.height},
        {"frameData", base64_encode(frame.payload.data(), frame.payload.size())}
    }));
}

bool FrameRelay::is_live() const {
    if (!session_id_ || !last_frame_at_) return false;
    return loop_.now() - *last_frame_at_ < options_.staleness;
}

bool FrameRelay::send_waiting_frame() {
    if (is_live()) return false;
    hub_.broadcast(StreamEvent::data(EventType::WaitingFrame, {
        {"message", "Waiting for video frames..."},
        {"timestamp", epoch_millis()}
    }));
    return true;
}

void FrameRelay::stop() {
    if (session_id_)
        std::cerr << "[relay] Stopped receiving frames (" << frames_relayed_ << " relayed, "
                  << frames_dropped_ << " dropped)\n";
    session_id_.reset();
    last_frame_at_.reset();
    last_sequence_.reset();
    has_current_frame_ = false;
}

} // namespace genstream
