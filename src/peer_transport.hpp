#pragma once
#include "video_frame.hpp"
#include <functional>
#include <memory>
#include <string>

namespace genstream {

enum class IceState { New, Checking, Connected, Completed, Failed, Disconnected, Closed };
enum class SignalingState { Stable, HaveLocalOffer, HaveRemoteOffer, HaveLocalPranswer, HaveRemotePranswer, Closed };
enum class GatheringState { New, InProgress, Complete };

const char* ice_state_name(IceState state);
const char* signaling_state_name(SignalingState state);
const char* gathering_state_name(GatheringState state);

// Callbacks a transport raises. They are always invoked on the event loop
// thread; implementations driven by foreign threads marshal via post().
struct PeerTransportCallbacks {
    std::function<void(IceState)> on_ice_state;
    std::function<void(SignalingState)> on_signaling_state;
    std::function<void(GatheringState)> on_gathering_state;
    // Complete local offer (after candidate gathering) or an error message.
    std::function<void(const std::string& sdp)> on_local_offer;
    std::function<void(const std::string& error)> on_failure;
    std::function<void(VideoFrame)> on_frame;
};

// The WebRTC connection object behind one signaling session. The transport
// owns the ICE/DTLS machinery; SignalingClient only observes its states.
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    virtual void set_callbacks(PeerTransportCallbacks callbacks) = 0;

    // Add a receive-only video transceiver and set the local offer. The SDP
    // is delivered through on_local_offer once gathering has completed.
    virtual void create_recv_only_offer() = 0;

    // Install the remote answer. Throws std::invalid_argument on malformed SDP.
    virtual void set_remote_answer(const std::string& sdp) = 0;

    virtual std::string local_description() const = 0;
    virtual std::string remote_description() const = 0;
    virtual IceState ice_state() const = 0;
    virtual SignalingState signaling_state() const = 0;
    virtual GatheringState gathering_state() const = 0;

    // Release the connection. Idempotent; no callbacks fire afterwards.
    virtual void close() = 0;
};

using PeerTransportFactory = std::function<std::unique_ptr<PeerTransport>()>;

} // namespace genstream
