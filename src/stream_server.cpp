#include "stream_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace genstream {

static constexpr size_t kMaxHeaderBytes = 16384;

// ── URL helpers ───────────────────────────────────────────────────────────────

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            char* end;
            long val = std::strtol(hex, &end, 16);
            if (end == hex + 2) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        } else if (s[i] == '+') {
            out += ' ';
            continue;
        }
        out += s[i];
    }
    return out;
}

static std::map<std::string, std::string> parse_query_string(const std::string& qs) {
    std::map<std::string, std::string> result;
    size_t start = 0;
    while (start <= qs.size()) {
        size_t amp = qs.find('&', start);
        if (amp == std::string::npos) amp = qs.size();
        std::string pair = qs.substr(start, amp - start);
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        } else if (!pair.empty()) {
            result[url_decode(pair)] = "";
        }
        start = amp + 1;
    }
    return result;
}

std::string HttpRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

// ── Parsing and formatting ────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.size() > 5) return false;
    for (char c : digits)
        if (c < '0' || c > '9') return false;
    int p = std::stoi(digits);
    if (p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

bool parse_request_head(const std::string& head, HttpRequest& req) {
    auto rl_end = head.find("\r\n");
    std::string request_line = head.substr(0, rl_end);
    {
        std::istringstream ss(request_line);
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) return false;
        if (ver.compare(0, 5, "HTTP/") != 0) return false;
        auto q = pq.find('?');
        if (q != std::string::npos) {
            req.path         = pq.substr(0, q);
            req.query_params = parse_query_string(pq.substr(q + 1));
        } else {
            req.path = pq;
        }
    }
    if (rl_end == std::string::npos) return true;

    size_t pos = rl_end + 2;
    while (pos < head.size()) {
        auto ne = head.find("\r\n", pos);
        if (ne == std::string::npos) ne = head.size();
        std::string hline = head.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }
    return true;
}

static const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default:  return "OK";
    }
}

std::string format_http_response(const HttpReply& reply) {
    std::string resp =
        "HTTP/1.1 " + std::to_string(reply.status) + " " + reason_phrase(reply.status) + "\r\n"
        "Content-Type: " + reply.content_type + "\r\n"
        "Content-Length: " + std::to_string(reply.body.size()) + "\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "Access-Control-Allow-Headers: Content-Type\r\n"
        "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
        "Connection: close\r\n\r\n";
    return resp + reply.body;
}

static HttpReply error_reply(int status, const std::string& message) {
    HttpReply r;
    r.status = status;
    r.body = nlohmann::json{{"error", message}}.dump();
    return r;
}

static bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// ── Push transport ────────────────────────────────────────────────────────────

// Subscriber side of an SSE connection. Holds the connection
// weakly: once the server closes it, send() fails and the hub drops us.
class StreamServer::PushTransport : public SubscriberTransport {
public:
    PushTransport(StreamServer& server, std::weak_ptr<Connection> conn)
        : server_(server), conn_(std::move(conn)) {}

    // The hub may outlive the server; an expired connection means there is
    // nothing left to close.
    ~PushTransport() override {
        if (!conn_.expired()) server_.close_later(conn_);
    }

    void send(const std::string& payload) override {
        auto conn = conn_.lock();
        if (!conn || conn->closed || conn->close_after_flush)
            throw std::runtime_error("connection closed");
        if (conn->out.size() + payload.size() > kMaxPendingOutput)
            throw std::runtime_error("subscriber too slow, output buffer full");

        server_.queue(conn, "data: " + payload + "\n\n");

        if (conn->closed || conn->close_after_flush)
            throw std::runtime_error("connection lost while sending");
    }

    bool is_open() const override {
        auto conn = conn_.lock();
        return conn && !conn->closed && !conn->close_after_flush;
    }

private:
    StreamServer& server_;
    std::weak_ptr<Connection> conn_;
};

// ── StreamServer ──────────────────────────────────────────────────────────────

StreamServer::StreamServer(EventLoop& loop, ServerConfig config, Handlers handlers)
    : loop_(loop)
    , config_(std::move(config))
    , handlers_(std::move(handlers))
{}

StreamServer::~StreamServer() {
    stop();
}

bool StreamServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(config_.listen, host, port)) {
        error = "Invalid listen address: " + config_.listen;
        return false;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        error = "Failed to create server socket";
        return false;
    }

    int opt = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        ::close(listen_fd_); listen_fd_ = -1;
        return false;
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        ::close(listen_fd_); listen_fd_ = -1;
        return false;
    }

    if (::listen(listen_fd_, 64) != 0 || !set_nonblocking(listen_fd_)) {
        error = std::string("listen failed: ") + std::strerror(errno);
        ::close(listen_fd_); listen_fd_ = -1;
        return false;
    }

    socklen_t len = sizeof(sa);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&sa), &len) == 0)
        port_ = ntohs(sa.sin_port);

    loop_.watch(listen_fd_, POLLIN, [this](short) { on_listener_ready(); });
    std::cerr << "[server] Listening on " << host << ":" << port_ << "\n";
    return true;
}

void StreamServer::stop() {
    if (listen_fd_ >= 0) {
        loop_.unwatch(listen_fd_);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    auto conns = connections_;
    for (auto& [fd, conn] : conns)
        close_connection(conn);
    connections_.clear();
}

void StreamServer::on_listener_ready() {
    for (;;) {
        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                std::cerr << "[server] accept failed: " << std::strerror(errno) << "\n";
            return;
        }
        if (!set_nonblocking(cfd)) {
            ::close(cfd);
            continue;
        }
#ifdef SO_NOSIGPIPE  // macOS
        int opt = 1;
        ::setsockopt(cfd, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif
        auto conn = std::make_shared<Connection>();
        conn->fd = cfd;
        connections_[cfd] = conn;
        loop_.watch(cfd, POLLIN, [this, cfd](short revents) { on_connection_io(cfd, revents); });
    }
}

void StreamServer::on_connection_io(int fd, short revents) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) return;
    auto conn = it->second;

    if (revents & (POLLERR | POLLNVAL)) {
        close_connection(conn);
        return;
    }
    if (revents & POLLOUT) flush(conn);
    if (conn->closed) return;
    if (revents & (POLLIN | POLLHUP)) read_available(conn);
}

void StreamServer::read_available(const std::shared_ptr<Connection>& conn) {
    char tmp[4096];
    for (;;) {
        ssize_t n = ::recv(conn->fd, tmp, sizeof(tmp), 0);
        if (n > 0) {
            conn->in.append(tmp, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        if (n < 0 && errno == EINTR) continue;
        // EOF or hard error.
        close_connection(conn);
        return;
    }

    switch (conn->mode) {
        case Mode::Http:        process_http(conn); break;
        case Mode::EventStream: conn->in.clear(); break;
    }
}

void StreamServer::process_http(const std::shared_ptr<Connection>& conn) {
    if (conn->close_after_flush) return;

    auto hdr_end = conn->in.find("\r\n\r\n");
    if (hdr_end == std::string::npos) {
        if (conn->in.size() > kMaxHeaderBytes)
            reply(conn, error_reply(400, "Headers too large"));
        return;
    }

    HttpRequest req;
    if (!parse_request_head(conn->in.substr(0, hdr_end), req)) {
        reply(conn, error_reply(400, "Malformed request"));
        return;
    }

    size_t content_len = 0;
    std::string cl = req.header("content-length");
    if (!cl.empty()) {
        char* end = nullptr;
        unsigned long long v = std::strtoull(cl.c_str(), &end, 10);
        if (end == cl.c_str() || *end != '\0') {
            reply(conn, error_reply(400, "Invalid Content-Length"));
            return;
        }
        if (v > config_.max_body) {
            reply(conn, error_reply(413, "Payload too large"));
            return;
        }
        content_len = static_cast<size_t>(v);
    }

    size_t body_start = hdr_end + 4;
    if (conn->in.size() - body_start < content_len) return;  // wait for the rest
    req.body = conn->in.substr(body_start, content_len);
    conn->in.erase(0, body_start + content_len);

    if (req.method == "GET" && req.path == "/api/stream") {
        open_event_stream(conn);
        return;
    }

    HttpReply r = handlers_.on_request ? handlers_.on_request(req) : error_reply(404, "Not found");
    reply(conn, r);
}

void StreamServer::open_event_stream(const std::shared_ptr<Connection>& conn) {
    conn->mode = Mode::EventStream;
    conn->in.clear();
    queue(conn,
          "HTTP/1.1 200 OK\r\n"
          "Content-Type: text/event-stream\r\n"
          "Cache-Control: no-cache\r\n"
          "Connection: keep-alive\r\n"
          "Access-Control-Allow-Origin: *\r\n\r\n");
    if (conn->closed) return;
    subscribe(conn);
}

void StreamServer::subscribe(const std::shared_ptr<Connection>& conn) {
    if (!handlers_.on_subscribe) {
        close_connection(conn);
        return;
    }
    conn->subscriber_id = handlers_.on_subscribe(
        std::make_unique<PushTransport>(*this, std::weak_ptr<Connection>(conn)));
}

void StreamServer::reply(const std::shared_ptr<Connection>& conn, const HttpReply& r) {
    queue(conn, format_http_response(r));
    conn->close_after_flush = true;
    flush(conn);
}

void StreamServer::queue(const std::shared_ptr<Connection>& conn, const std::string& bytes) {
    if (conn->closed) return;
    conn->out += bytes;
    flush(conn);
}

void StreamServer::flush(const std::shared_ptr<Connection>& conn) {
    if (conn->closed) return;
    while (!conn->out.empty()) {
        ssize_t n = ::send(conn->fd, conn->out.data(), conn->out.size(), MSG_NOSIGNAL);
        if (n > 0) {
            conn->out.erase(0, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        // The peer is gone. Closing here could re-enter whoever is sending,
        // so only mark it and let the loop finish the job.
        conn->close_after_flush = true;
        conn->out.clear();
        close_later(conn);
        return;
    }

    if (conn->out.empty() && conn->close_after_flush) {
        close_later(conn);
        return;
    }
    int fd = conn->fd;
    short events = conn->out.empty() ? POLLIN : (POLLIN | POLLOUT);
    loop_.watch(fd, events, [this, fd](short revents) { on_connection_io(fd, revents); });
}

void StreamServer::close_later(const std::weak_ptr<Connection>& weak) {
    auto conn = weak.lock();
    if (!conn || conn->closed) return;
    loop_.post([this, weak]() {
        // Connections die with the server, so a live one means we are too.
        if (auto c = weak.lock()) close_connection(c);
    });
}

void StreamServer::close_connection(const std::shared_ptr<Connection>& conn) {
    if (conn->closed) return;
    conn->closed = true;
    loop_.unwatch(conn->fd);
    ::close(conn->fd);
    connections_.erase(conn->fd);

    if (!conn->subscriber_id.empty() && handlers_.on_close)
        handlers_.on_close(conn->subscriber_id);
}

} // namespace genstream
