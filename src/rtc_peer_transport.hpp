#pragma once
#include "config.hpp"
#include "event_loop.hpp"
#include "frame_pipeline.hpp"
#include "peer_transport.hpp"
#include <memory>

namespace rtc {
class PeerConnection;
class Track;
} // namespace rtc

namespace genstream {

// PeerTransport backed by a libdatachannel PeerConnection. libdatachannel
// raises its callbacks on internal threads; every one is re-posted onto the
// event loop before user code sees it.
class RtcPeerTransport : public PeerTransport {
public:
    RtcPeerTransport(EventLoop& loop, const SignalingConfig& config,
                     std::unique_ptr<FramePipeline> pipeline);
    ~RtcPeerTransport() override;

    RtcPeerTransport(const RtcPeerTransport&) = delete;
    RtcPeerTransport& operator=(const RtcPeerTransport&) = delete;

    void set_callbacks(PeerTransportCallbacks callbacks) override;
    void create_recv_only_offer() override;
    void set_remote_answer(const std::string& sdp) override;

    std::string local_description() const override;
    std::string remote_description() const override;
    IceState ice_state() const override;
    SignalingState signaling_state() const override;
    GatheringState gathering_state() const override;

    void close() override;

private:
    struct Shared;

    std::shared_ptr<Shared> shared_;
    std::shared_ptr<rtc::PeerConnection> pc_;
    std::shared_ptr<rtc::Track> track_;
};

// Factory producing RtcPeerTransports with a PassthroughPipeline sized from
// the relay config.
PeerTransportFactory make_rtc_transport_factory(EventLoop& loop, const Config& config);

// Route libdatachannel's own log output to stderr at warning level.
void init_rtc_logging();

} // namespace genstream
