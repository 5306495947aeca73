#pragma once
#include "config.hpp"
#include "connection_hub.hpp"
#include "event_loop.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace genstream {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query_params;  // URL-decoded
    std::map<std::string, std::string> headers;       // names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;
    // Return a header value (name matched case-insensitively), or "" if absent.
    std::string header(const std::string& name) const;
};

struct HttpReply {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Parse "host:port". Port 0 asks the kernel for an ephemeral port.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Parse the request line and headers (everything before the blank line).
bool parse_request_head(const std::string& head, HttpRequest& req);

std::string format_http_response(const HttpReply& reply);

// Non-blocking HTTP/1.1 server driven by the event loop. Plain requests are
// answered and closed. GET /api/stream becomes a server-sent-events stream
// handed over as a push subscriber.
class StreamServer {
public:
    struct Handlers {
        std::function<HttpReply(const HttpRequest&)> on_request;
        // Takes ownership of a new push subscriber; returns its id.
        std::function<std::string(std::unique_ptr<SubscriberTransport>)> on_subscribe;
        // The peer went away or the connection failed.
        std::function<void(const std::string& subscriber_id)> on_close;
    };

    // Outbound bytes buffered per connection before the subscriber is
    // considered too slow and dropped.
    static constexpr size_t kMaxPendingOutput = 8 * 1024 * 1024;

    StreamServer(EventLoop& loop, ServerConfig config, Handlers handlers);
    ~StreamServer();

    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;

    // Bind and start accepting. Returns false and populates error on failure.
    bool start(std::string& error);

    // Close the listener and every connection. Idempotent.
    void stop();

    // Actual bound port (useful when listening on port 0).
    uint16_t port() const { return port_; }
    size_t connection_count() const { return connections_.size(); }

private:
    enum class Mode { Http, EventStream };

    struct Connection {
        int fd = -1;
        Mode mode = Mode::Http;
        std::string in;
        std::string out;
        bool close_after_flush = false;
        bool closed = false;
        std::string subscriber_id;
    };

    class PushTransport;

    void on_listener_ready();
    void on_connection_io(int fd, short revents);
    void read_available(const std::shared_ptr<Connection>& conn);
    void process_http(const std::shared_ptr<Connection>& conn);
    void open_event_stream(const std::shared_ptr<Connection>& conn);
    void subscribe(const std::shared_ptr<Connection>& conn);
    void reply(const std::shared_ptr<Connection>& conn, const HttpReply& reply);

    // Append and try to write immediately; leftovers wait for POLLOUT.
    void queue(const std::shared_ptr<Connection>& conn, const std::string& bytes);
    void flush(const std::shared_ptr<Connection>& conn);
    void close_connection(const std::shared_ptr<Connection>& conn);
    void close_later(const std::weak_ptr<Connection>& conn);

    EventLoop& loop_;
    ServerConfig config_;
    Handlers handlers_;

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::map<int, std::shared_ptr<Connection>> connections_;
};

} // namespace genstream
