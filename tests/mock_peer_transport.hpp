#pragma once
#include "peer_transport.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace genstream {

class MockPeerTransport;

// Shared between a test and the transports its factory creates; the test
// drives whichever transport is current.
struct MockPeerControl {
    int created = 0;
    int closed = 0;
    int destroyed = 0;
    bool throw_on_create = false;
    bool reject_answer = false;
    MockPeerTransport* current = nullptr;
};

class MockPeerTransport : public PeerTransport {
public:
    explicit MockPeerTransport(std::shared_ptr<MockPeerControl> control)
        : control_(std::move(control)) {
        control_->current = this;
    }

    ~MockPeerTransport() override {
        control_->destroyed++;
        if (control_->current == this) control_->current = nullptr;
    }

    void set_callbacks(PeerTransportCallbacks callbacks) override { cb_ = std::move(callbacks); }

    void create_recv_only_offer() override {
        offer_requested = true;
        signaling_ = SignalingState::HaveLocalOffer;
        gathering_ = GatheringState::InProgress;
    }

    void set_remote_answer(const std::string& sdp) override {
        if (control_->reject_answer || sdp.compare(0, 4, "v=0\n") != 0)
            throw std::invalid_argument("malformed SDP");
        remote_ = sdp;
        signaling_ = SignalingState::Stable;
    }

    std::string local_description() const override { return local_; }
    std::string remote_description() const override { return remote_; }
    IceState ice_state() const override { return ice_; }
    SignalingState signaling_state() const override { return signaling_; }
    GatheringState gathering_state() const override { return gathering_; }

    void close() override {
        if (closed_) return;
        closed_ = true;
        control_->closed++;
        cb_ = {};
        if (control_->current == this) control_->current = nullptr;
    }

    // ── Test drivers ─────────────────────────────────────────────

    void finish_gathering(const std::string& sdp = "v=0\nm=video 9 UDP/TLS/RTP/SAVPF 96\na=recvonly\n") {
        local_ = sdp;
        gathering_ = GatheringState::Complete;
        auto cb = cb_.on_local_offer;   // close() may clear cb_ mid-call
        if (cb) cb(sdp);
    }

    void set_ice(IceState state) {
        ice_ = state;
        auto cb = cb_.on_ice_state;
        if (cb) cb(state);
    }

    void emit_frame(uint64_t sequence, std::vector<uint8_t> payload = {1, 2, 3}) {
        VideoFrame f;
        f.sequence = sequence;
        f.captured_at = 1000 + static_cast<int64_t>(sequence);
        f.width = 1920;
        f.height = 1080;
        f.payload = std::move(payload);
        auto cb = cb_.on_frame;
        if (cb) cb(std::move(f));
    }

    void fail(const std::string& error) {
        auto cb = cb_.on_failure;
        if (cb) cb(error);
    }

    bool offer_requested = false;

private:
    std::shared_ptr<MockPeerControl> control_;
    PeerTransportCallbacks cb_;
    std::string local_;
    std::string remote_;
    IceState ice_ = IceState::New;
    SignalingState signaling_ = SignalingState::Stable;
    GatheringState gathering_ = GatheringState::New;
    bool closed_ = false;
};

inline PeerTransportFactory mock_transport_factory(std::shared_ptr<MockPeerControl> control) {
    return [control]() -> std::unique_ptr<PeerTransport> {
        if (control->throw_on_create) throw std::runtime_error("peer connection unavailable");
        control->created++;
        return std::make_unique<MockPeerTransport>(control);
    };
}

} // namespace genstream
