#include "ws_server.hpp"
#include "stream_server.hpp"

#include <rtc/rtc.hpp>

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <variant>

namespace genstream {

struct WsServer::Shared {
    Shared(EventLoop& l, WsServer& s) : loop(l), server(s) {}

    EventLoop& loop;
    WsServer& server;
    std::atomic<bool> open{true};

    // Run fn on the loop thread unless the server stopped meanwhile.
    static void dispatch(const std::weak_ptr<Shared>& weak,
                         std::function<void(WsServer&)> fn) {
        auto self = weak.lock();
        if (!self || !self->open.load()) return;
        self->loop.post([self, fn = std::move(fn)]() {
            if (self->open.load()) fn(self->server);
        });
    }
};

namespace {

// Subscriber side of one WebSocket client. The hub drops it on a failed
// send, which hangs up the socket.
class SocketTransport : public SubscriberTransport {
public:
    explicit SocketTransport(std::shared_ptr<rtc::WebSocket> ws) : ws_(std::move(ws)) {}

    ~SocketTransport() override {
        if (ws_->isOpen()) ws_->close();
    }

    void send(const std::string& payload) override {
        if (!ws_->isOpen())
            throw std::runtime_error("connection closed");
        if (ws_->bufferedAmount() + payload.size() > WsServer::kMaxPendingOutput)
            throw std::runtime_error("subscriber too slow, output buffer full");
        ws_->send(payload);
    }

    bool is_open() const override { return ws_->isOpen(); }

private:
    std::shared_ptr<rtc::WebSocket> ws_;
};

} // namespace

WsServer::WsServer(EventLoop& loop, ServerConfig config, Handlers handlers)
    : loop_(loop)
    , config_(std::move(config))
    , handlers_(std::move(handlers))
{}

WsServer::~WsServer() {
    stop();
}

bool WsServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(config_.ws_listen, host, port)) {
        error = "Invalid WebSocket listen address: " + config_.ws_listen;
        return false;
    }

    rtc::WebSocketServer::Configuration ws_config;
    ws_config.port = port;
    ws_config.enableTls = false;
    ws_config.bindAddress = host;

    try {
        server_ = std::make_unique<rtc::WebSocketServer>(ws_config);
    } catch (const std::exception& e) {
        error = std::string("WebSocket server failed to start: ") + e.what();
        return false;
    }
    port_ = server_->port();
    shared_ = std::make_shared<Shared>(loop_, *this);

    std::weak_ptr<Shared> weak = shared_;
    server_->onClient([weak](std::shared_ptr<rtc::WebSocket> ws) {
        const rtc::WebSocket* key = ws.get();

        // Hand the socket to the loop before any of its events can be posted.
        Shared::dispatch(weak, [ws](WsServer& s) {
            s.clients_.emplace(ws.get(), Client{ws, ""});
        });

        ws->onOpen([weak, key]() {
            Shared::dispatch(weak, [key](WsServer& s) { s.on_open(key); });
        });
        ws->onMessage([weak, key](rtc::message_variant data) {
            if (!std::holds_alternative<std::string>(data)) return;
            Shared::dispatch(weak, [key, text = std::get<std::string>(std::move(data))](WsServer& s) {
                s.on_text(key, text);
            });
        });
        ws->onError([](std::string err) {
            std::cerr << "[ws] WebSocket error: " << err << "\n";
        });
        ws->onClosed([weak, key]() {
            Shared::dispatch(weak, [key](WsServer& s) { s.on_closed(key); });
        });
    });

    std::cerr << "[ws] Listening on " << host << ":" << port_ << "\n";
    return true;
}

void WsServer::stop() {
    if (shared_) {
        shared_->open.store(false);
        shared_.reset();
    }
    if (server_) {
        server_->stop();
        server_.reset();
    }

    auto clients = std::move(clients_);
    clients_.clear();
    for (auto& [key, client] : clients) {
        if (client.ws->isOpen()) client.ws->close();
        if (!client.subscriber_id.empty() && handlers_.on_close)
            handlers_.on_close(client.subscriber_id);
    }
}

void WsServer::on_open(const rtc::WebSocket* key) {
    auto it = clients_.find(key);
    if (it == clients_.end() || !it->second.subscriber_id.empty()) return;
    auto ws = it->second.ws;
    if (!handlers_.on_subscribe) {
        ws->close();
        return;
    }
    // on_subscribe may greet the client, fail the send and close it; the
    // closed event then arrives later through the loop.
    it->second.subscriber_id = handlers_.on_subscribe(std::make_unique<SocketTransport>(ws));
}

void WsServer::on_text(const rtc::WebSocket* key, const std::string& text) {
    auto it = clients_.find(key);
    if (it == clients_.end() || it->second.subscriber_id.empty()) return;
    if (text.size() > config_.max_body) {
        std::cerr << "[ws] Closing " << it->second.subscriber_id << ": message of "
                  << text.size() << " bytes exceeds " << config_.max_body << "\n";
        it->second.ws->close();
        return;
    }
    if (handlers_.on_message)
        handlers_.on_message(it->second.subscriber_id, text);
}

void WsServer::on_closed(const rtc::WebSocket* key) {
    auto it = clients_.find(key);
    if (it == clients_.end()) return;
    std::string id = std::move(it->second.subscriber_id);
    clients_.erase(it);
    if (!id.empty() && handlers_.on_close)
        handlers_.on_close(id);
}

} // namespace genstream
