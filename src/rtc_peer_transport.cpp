#include "rtc_peer_transport.hpp"

#include <rtc/rtc.hpp>

#include <atomic>
#include <iostream>
#include <stdexcept>

namespace genstream {

struct RtcPeerTransport::Shared {
    explicit Shared(EventLoop& l, std::unique_ptr<FramePipeline> p)
        : loop(l), pipeline(std::move(p)) {}

    EventLoop& loop;
    std::atomic<bool> open{true};
    PeerTransportCallbacks callbacks;        // loop thread only
    std::unique_ptr<FramePipeline> pipeline; // media thread only

    // Run fn on the loop thread unless the transport was closed meanwhile.
    static void dispatch(const std::weak_ptr<Shared>& weak,
                         std::function<void(Shared&)> fn) {
        auto self = weak.lock();
        if (!self || !self->open.load()) return;
        self->loop.post([self, fn = std::move(fn)]() {
            if (self->open.load()) fn(*self);
        });
    }
};

static IceState to_ice_state(rtc::PeerConnection::IceState s) {
    using S = rtc::PeerConnection::IceState;
    switch (s) {
        case S::New:          return IceState::New;
        case S::Checking:     return IceState::Checking;
        case S::Connected:    return IceState::Connected;
        case S::Completed:    return IceState::Completed;
        case S::Failed:       return IceState::Failed;
        case S::Disconnected: return IceState::Disconnected;
        case S::Closed:       return IceState::Closed;
    }
    return IceState::New;
}

static SignalingState to_signaling_state(rtc::PeerConnection::SignalingState s) {
    using S = rtc::PeerConnection::SignalingState;
    switch (s) {
        case S::Stable:             return SignalingState::Stable;
        case S::HaveLocalOffer:     return SignalingState::HaveLocalOffer;
        case S::HaveRemoteOffer:    return SignalingState::HaveRemoteOffer;
        case S::HaveLocalPranswer:  return SignalingState::HaveLocalPranswer;
        case S::HaveRemotePranswer: return SignalingState::HaveRemotePranswer;
    }
    return SignalingState::Stable;
}

static GatheringState to_gathering_state(rtc::PeerConnection::GatheringState s) {
    using S = rtc::PeerConnection::GatheringState;
    switch (s) {
        case S::New:        return GatheringState::New;
        case S::InProgress: return GatheringState::InProgress;
        case S::Complete:   return GatheringState::Complete;
    }
    return GatheringState::New;
}

RtcPeerTransport::RtcPeerTransport(EventLoop& loop, const SignalingConfig& config,
                                   std::unique_ptr<FramePipeline> pipeline)
    : shared_(std::make_shared<Shared>(loop, std::move(pipeline)))
{
    rtc::Configuration rtc_config;
    for (const auto& url : config.ice_servers)
        rtc_config.iceServers.emplace_back(url);
    pc_ = std::make_shared<rtc::PeerConnection>(rtc_config);

    std::weak_ptr<Shared> weak = shared_;
    std::weak_ptr<rtc::PeerConnection> wpc = pc_;

    pc_->onIceStateChange([weak](rtc::PeerConnection::IceState state) {
        IceState s = to_ice_state(state);
        Shared::dispatch(weak, [s](Shared& sh) {
            if (sh.callbacks.on_ice_state) sh.callbacks.on_ice_state(s);
        });
    });

    pc_->onSignalingStateChange([weak](rtc::PeerConnection::SignalingState state) {
        SignalingState s = to_signaling_state(state);
        Shared::dispatch(weak, [s](Shared& sh) {
            if (sh.callbacks.on_signaling_state) sh.callbacks.on_signaling_state(s);
        });
    });

    // Non-trickle WHEP: the offer is only complete once gathering is done.
    pc_->onGatheringStateChange([weak, wpc](rtc::PeerConnection::GatheringState state) {
        GatheringState s = to_gathering_state(state);
        Shared::dispatch(weak, [s](Shared& sh) {
            if (sh.callbacks.on_gathering_state) sh.callbacks.on_gathering_state(s);
        });
        if (state != rtc::PeerConnection::GatheringState::Complete) return;

        auto pc = wpc.lock();
        if (!pc) return;
        auto description = pc->localDescription();
        if (!description) {
            Shared::dispatch(weak, [](Shared& sh) {
                if (sh.callbacks.on_failure) sh.callbacks.on_failure("no local description after gathering");
            });
            return;
        }
        std::string sdp = std::string(*description);
        Shared::dispatch(weak, [sdp](Shared& sh) {
            if (sh.callbacks.on_local_offer) sh.callbacks.on_local_offer(sdp);
        });
    });
}

RtcPeerTransport::~RtcPeerTransport() {
    close();
}

void RtcPeerTransport::set_callbacks(PeerTransportCallbacks callbacks) {
    shared_->callbacks = std::move(callbacks);
}

void RtcPeerTransport::create_recv_only_offer() {
    rtc::Description::Video media("video", rtc::Description::Direction::RecvOnly);
    media.addH264Codec(96);
    track_ = pc_->addTrack(media);

    // Reassemble RTP into H.264 access units before they reach the pipeline.
    track_->setMediaHandler(std::make_shared<rtc::H264RtpDepacketizer>());

    std::weak_ptr<Shared> weak = shared_;
    track_->onOpen([]() { std::cerr << "[whep] Received media track\n"; });
    track_->onFrame([weak](rtc::binary data, rtc::FrameInfo info) {
        auto self = weak.lock();
        if (!self || !self->open.load() || !self->pipeline) return;
        auto frame = self->pipeline->process(
            reinterpret_cast<const uint8_t*>(data.data()), data.size(), info.timestamp);
        if (!frame) return;
        Shared::dispatch(weak, [f = std::move(*frame)](Shared& sh) mutable {
            if (sh.callbacks.on_frame) sh.callbacks.on_frame(std::move(f));
        });
    });

    pc_->setLocalDescription(rtc::Description::Type::Offer);
}

void RtcPeerTransport::set_remote_answer(const std::string& sdp) {
    // rtc::Description throws std::invalid_argument on unparsable SDP.
    pc_->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Answer));
}

std::string RtcPeerTransport::local_description() const {
    auto d = pc_->localDescription();
    return d ? std::string(*d) : std::string();
}

std::string RtcPeerTransport::remote_description() const {
    auto d = pc_->remoteDescription();
    return d ? std::string(*d) : std::string();
}

IceState RtcPeerTransport::ice_state() const {
    if (!shared_->open.load()) return IceState::Closed;
    return to_ice_state(pc_->iceState());
}

SignalingState RtcPeerTransport::signaling_state() const {
    if (!shared_->open.load()) return SignalingState::Closed;
    return to_signaling_state(pc_->signalingState());
}

GatheringState RtcPeerTransport::gathering_state() const {
    return to_gathering_state(pc_->gatheringState());
}

void RtcPeerTransport::close() {
    if (!shared_->open.exchange(false)) return;
    if (track_) track_->resetCallbacks();
    pc_->resetCallbacks();
    pc_->close();
}

PeerTransportFactory make_rtc_transport_factory(EventLoop& loop, const Config& config) {
    SignalingConfig signaling = config.signaling;
    uint32_t width = config.relay.default_width;
    uint32_t height = config.relay.default_height;
    return [&loop, signaling, width, height]() -> std::unique_ptr<PeerTransport> {
        return std::make_unique<RtcPeerTransport>(
            loop, signaling, std::make_unique<PassthroughPipeline>(width, height));
    };
}

void init_rtc_logging() {
    rtc::InitLogger(rtc::LogLevel::Warning, [](rtc::LogLevel, std::string message) {
        std::cerr << "[rtc] " << message << "\n";
    });
}

} // namespace genstream
