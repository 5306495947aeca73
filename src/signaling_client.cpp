#include "signaling_client.hpp"

#include <iostream>
#include <stdexcept>

namespace genstream {

const char* ice_state_name(IceState state) {
    switch (state) {
        case IceState::New:          return "new";
        case IceState::Checking:     return "checking";
        case IceState::Connected:    return "connected";
        case IceState::Completed:    return "completed";
        case IceState::Failed:       return "failed";
        case IceState::Disconnected: return "disconnected";
        case IceState::Closed:       return "closed";
    }
    return "unknown";
}

const char* signaling_state_name(SignalingState state) {
    switch (state) {
        case SignalingState::Stable:             return "stable";
        case SignalingState::HaveLocalOffer:     return "have-local-offer";
        case SignalingState::HaveRemoteOffer:    return "have-remote-offer";
        case SignalingState::HaveLocalPranswer:  return "have-local-pranswer";
        case SignalingState::HaveRemotePranswer: return "have-remote-pranswer";
        case SignalingState::Closed:             return "closed";
    }
    return "unknown";
}

const char* gathering_state_name(GatheringState state) {
    switch (state) {
        case GatheringState::New:        return "new";
        case GatheringState::InProgress: return "gathering";
        case GatheringState::Complete:   return "complete";
    }
    return "unknown";
}

nlohmann::json SignalingSnapshot::to_json() const {
    return {
        {"hasSession", has_session},
        {"isConnected", connected},
        {"endpoint", endpoint},
        {"iceConnectionState", ice_state},
        {"signalingState", signaling_state},
        {"iceGatheringState", gathering_state},
        {"hasLocalDescription", has_local_description},
        {"hasRemoteDescription", has_remote_description}
    };
}

SignalingClient::SignalingClient(EventLoop& loop, HttpClient& http,
                                 PeerTransportFactory factory,
                                 long handshake_timeout_seconds)
    : loop_(loop)
    , http_(http)
    , factory_(std::move(factory))
    , handshake_timeout_seconds_(handshake_timeout_seconds)
{}

SignalingClient::~SignalingClient() {
    if (transport_) transport_->close();
}

void SignalingClient::connect(const std::string& endpoint_url) {
    if (transport_) disconnect();

    uint64_t attempt = ++attempt_;
    endpoint_ = endpoint_url;
    connected_ = false;
    down_ = false;
    std::cerr << "[whep] Connecting to WHEP endpoint: " << endpoint_url << "\n";

    try {
        transport_ = factory_();
    } catch (const std::exception& e) {
        fail(attempt, std::string("WHEP connection failed: ") + e.what());
        return;
    }

    PeerTransportCallbacks cb;
    cb.on_ice_state = [this, attempt](IceState s) { on_ice_state(attempt, s); };
    cb.on_signaling_state = [this, attempt](SignalingState s) {
        if (attempt == attempt_)
            std::cerr << "[whep] Signaling state: " << signaling_state_name(s) << "\n";
    };
    cb.on_gathering_state = [this, attempt](GatheringState s) {
        if (attempt == attempt_)
            std::cerr << "[whep] ICE gathering state: " << gathering_state_name(s) << "\n";
    };
    cb.on_local_offer = [this, attempt](const std::string& sdp) { on_local_offer(attempt, sdp); };
    cb.on_failure = [this, attempt](const std::string& err) {
        fail(attempt, "WHEP connection failed: " + err);
    };
    cb.on_frame = [this, attempt](VideoFrame frame) {
        if (attempt != attempt_ || !handlers_.on_frame) return;
        handlers_.on_frame(std::move(frame));
    };
    transport_->set_callbacks(std::move(cb));

    try {
        transport_->create_recv_only_offer();
    } catch (const std::exception& e) {
        fail(attempt, std::string("WHEP offer failed: ") + e.what());
    }
}

void SignalingClient::on_local_offer(uint64_t attempt, const std::string& sdp) {
    if (attempt != attempt_ || !transport_) return;
    if (sdp.empty()) {
        fail(attempt, "WHEP offer failed: empty local description");
        return;
    }

    // Blocking POST runs on a worker; the answer comes back through the loop.
    HttpClient& http = http_;
    EventLoop& loop = loop_;
    std::string url = endpoint_;
    long timeout = handshake_timeout_seconds_;
    loop_.offload([this, &http, &loop, url, sdp, timeout, attempt]() {
        HttpResponse resp = http.post(url, sdp, {
            {"Content-Type", "application/sdp"},
            {"Accept", "application/sdp"}
        }, timeout);
        loop.post([this, attempt, resp]() { on_answer(attempt, resp); });
    });
}

void SignalingClient::on_answer(uint64_t attempt, const HttpResponse& response) {
    if (attempt != attempt_ || !transport_) {
        std::cerr << "[whep] Discarding answer from a superseded handshake\n";
        return;
    }
    if (response.status_code == 0) {
        fail(attempt, "WHEP handshake failed: no response from " + endpoint_);
        return;
    }
    if (!response.ok()) {
        fail(attempt, "WHEP handshake failed: HTTP " + std::to_string(response.status_code));
        return;
    }
    if (response.body.empty()) {
        fail(attempt, "WHEP handshake failed: empty answer SDP");
        return;
    }

    try {
        transport_->set_remote_answer(response.body);
    } catch (const std::exception& e) {
        fail(attempt, std::string("WHEP handshake failed: invalid answer SDP: ") + e.what());
        return;
    }
    std::cerr << "[whep] Remote answer installed\n";
}

void SignalingClient::on_ice_state(uint64_t attempt, IceState state) {
    if (attempt != attempt_) return;
    std::cerr << "[whep] ICE connection state: " << ice_state_name(state) << "\n";

    switch (state) {
        case IceState::Connected:
        case IceState::Completed:
            down_ = false;
            if (!connected_) {
                connected_ = true;
                std::cerr << "[whep] WHEP connection established\n";
                if (handlers_.on_connect) handlers_.on_connect();
            }
            break;
        case IceState::Disconnected:
        case IceState::Failed:
        case IceState::Closed:
            connected_ = false;
            if (!down_) {
                down_ = true;
                if (handlers_.on_disconnect) handlers_.on_disconnect(ice_state_name(state));
            }
            break;
        case IceState::New:
        case IceState::Checking:
            down_ = false;
            break;
    }
}

void SignalingClient::fail(uint64_t attempt, const std::string& reason) {
    if (attempt != attempt_) return;
    std::cerr << "[whep] " << reason << "\n";
    ++attempt_;
    release_transport();
    if (handlers_.on_error) handlers_.on_error(reason);
}

void SignalingClient::release_transport() {
    connected_ = false;
    down_ = false;
    if (!transport_) return;
    transport_->close();
    // We may be running inside one of the transport's callbacks; destroy it
    // on the next loop turn.
    std::shared_ptr<PeerTransport> retired(std::move(transport_));
    loop_.post([retired]() {});
}

void SignalingClient::disconnect() {
    ++attempt_;
    if (!transport_) return;
    release_transport();
    std::cerr << "[whep] WHEP connection closed\n";
}

SignalingSnapshot SignalingClient::get_state() const {
    SignalingSnapshot snap;
    snap.connected = connected_;
    snap.endpoint = endpoint_;
    if (!transport_) return snap;
    snap.has_session = true;
    snap.ice_state = ice_state_name(transport_->ice_state());
    snap.signaling_state = signaling_state_name(transport_->signaling_state());
    snap.gathering_state = gathering_state_name(transport_->gathering_state());
    snap.has_local_description = !transport_->local_description().empty();
    snap.has_remote_description = !transport_->remote_description().empty();
    return snap;
}

} // namespace genstream
