#pragma once
#include "connection_hub.hpp"
#include "frame_relay.hpp"
#include "generation_orchestrator.hpp"
#include "signaling_client.hpp"
#include "stream_server.hpp"
#include "ws_server.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace genstream {

// Request and client-message handlers shared by the HTTP routes and the
// WebSocket and SSE subscribers. Everything runs on the loop thread.
class StreamApi {
public:
    StreamApi(ConnectionHub& hub, FrameRelay& relay, GenerationOrchestrator& orchestrator,
              const SignalingClient& signaling, size_t history_replay = 20);

    // GET /health, GET /api/status, POST /api/generate; 404 otherwise.
    HttpReply handle(const HttpRequest& req);

    // Register a push subscriber and replay recent history to it.
    std::string subscribe(std::unique_ptr<SubscriberTransport> transport);

    // start_generation, stop_generation, get_status. Anything else is
    // logged and ignored.
    void on_client_message(const std::string& subscriber_id, const std::string& text);

    void on_subscriber_closed(const std::string& subscriber_id);

    nlohmann::json health() const;
    nlohmann::json status() const;
    // Body of a status_response event.
    nlohmann::json stream_status() const;

    // Wrap as the HTTP/SSE server's handler set.
    StreamServer::Handlers handlers();
    // Wrap as the WebSocket server's handler set.
    WsServer::Handlers ws_handlers();

private:
    HttpReply generate(const HttpRequest& req);

    ConnectionHub& hub_;
    FrameRelay& relay_;
    GenerationOrchestrator& orchestrator_;
    const SignalingClient& signaling_;
    size_t history_replay_;
};

} // namespace genstream
