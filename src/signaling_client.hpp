#pragma once
#include "event_loop.hpp"
#include "http.hpp"
#include "peer_transport.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace genstream {

struct SignalingHandlers {
    std::function<void()> on_connect;
    std::function<void(VideoFrame)> on_frame;
    std::function<void(const std::string& reason)> on_error;
    std::function<void(const std::string& state)> on_disconnect;
};

// Diagnostic view of the current signaling session.
struct SignalingSnapshot {
    bool has_session = false;
    bool connected = false;
    std::string endpoint;
    std::string ice_state = "none";
    std::string signaling_state = "none";
    std::string gathering_state = "none";
    bool has_local_description = false;
    bool has_remote_description = false;

    nlohmann::json to_json() const;
};

// WHEP egress client: one receive-only offer POSTed to the endpoint, the
// response body installed as the answer. Connectivity transitions are
// derived from the transport's ICE state.
class SignalingClient {
public:
    SignalingClient(EventLoop& loop, HttpClient& http, PeerTransportFactory factory,
                    long handshake_timeout_seconds = 10);
    ~SignalingClient();

    SignalingClient(const SignalingClient&) = delete;
    SignalingClient& operator=(const SignalingClient&) = delete;

    void set_handlers(SignalingHandlers handlers) { handlers_ = std::move(handlers); }

    // Start a handshake with endpoint_url, replacing any current session.
    // Failures are reported through on_error.
    void connect(const std::string& endpoint_url);

    // Tear down the session. No-op when already disconnected; raises no callbacks.
    void disconnect();

    SignalingSnapshot get_state() const;
    bool is_connected() const { return connected_; }
    bool has_session() const { return transport_ != nullptr; }

private:
    void on_local_offer(uint64_t attempt, const std::string& sdp);
    void on_answer(uint64_t attempt, const HttpResponse& response);
    void on_ice_state(uint64_t attempt, IceState state);
    void fail(uint64_t attempt, const std::string& reason);
    void release_transport();

    EventLoop& loop_;
    HttpClient& http_;
    PeerTransportFactory factory_;
    long handshake_timeout_seconds_;
    SignalingHandlers handlers_;

    std::unique_ptr<PeerTransport> transport_;
    std::string endpoint_;
    uint64_t attempt_ = 0;     // bumped on connect/disconnect; stale results compare unequal
    bool connected_ = false;
    bool down_ = false;        // inside the disconnected/failed/closed family
};

} // namespace genstream
