#pragma once
#include "config.hpp"
#include "connection_hub.hpp"
#include "event_loop.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace rtc {
class WebSocket;
class WebSocketServer;
} // namespace rtc

namespace genstream {

// Duplex subscriber endpoint served by libdatachannel's WebSocketServer on
// its own port. Accepts, messages and hang-ups arrive on libdatachannel
// threads and are re-posted onto the event loop before any handler runs.
class WsServer {
public:
    struct Handlers {
        // Takes ownership of a new push subscriber; returns its id.
        std::function<std::string(std::unique_ptr<SubscriberTransport>)> on_subscribe;
        // A text message from a subscriber.
        std::function<void(const std::string& subscriber_id, const std::string& text)> on_message;
        std::function<void(const std::string& subscriber_id)> on_close;
    };

    // Queued outbound bytes per socket before the subscriber counts as too slow.
    static constexpr size_t kMaxPendingOutput = 8 * 1024 * 1024;

    WsServer(EventLoop& loop, ServerConfig config, Handlers handlers);
    ~WsServer();

    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    // Bind config.ws_listen. Returns false and populates error on failure.
    bool start(std::string& error);

    // Close the listener and every client. Idempotent; loop thread only.
    void stop();

    uint16_t port() const { return port_; }
    size_t client_count() const { return clients_.size(); }

private:
    struct Shared;

    void on_open(const rtc::WebSocket* ws);
    void on_text(const rtc::WebSocket* ws, const std::string& text);
    void on_closed(const rtc::WebSocket* ws);

    EventLoop& loop_;
    ServerConfig config_;
    Handlers handlers_;

    std::shared_ptr<Shared> shared_;
    std::unique_ptr<rtc::WebSocketServer> server_;
    uint16_t port_ = 0;

    struct Client {
        std::shared_ptr<rtc::WebSocket> ws;
        std::string subscriber_id;
    };
    std::map<const rtc::WebSocket*, Client> clients_;  // loop thread only
};

} // namespace genstream
