// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl); http_init/cleanup are
// no-ops because OpenSSL 1.1+ initialises itself.
#ifdef __linux__

#include "http.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

namespace genstream {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

static bool aborted() {
    return g_socket_abort_flag &&
           g_socket_abort_flag->load(std::memory_order_relaxed);
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target; // path + query, always starts with '/'
};

static std::optional<ParsedUrl> parse_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    std::string scheme = to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") return std::nullopt;

    ParsedUrl result;
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string authority = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    if (authority.empty()) return std::nullopt;

    if (path_start == std::string::npos) {
        result.target = "/";
    } else if (url[path_start] == '?') {
        result.target = "/" + url.substr(path_start);
    } else {
        result.target = url.substr(path_start);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        result.host = authority.substr(0, colon);
        result.port = authority.substr(colon + 1);
    } else {
        result.host = authority;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty() || result.port.empty()) return std::nullopt;
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

class Connection {
public:
    Connection() = default;
    ~Connection() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool open(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        for (auto* ai = res; ai && fd_ < 0; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;
            if (connect_with_timeout(fd, ai, timeout_secs)) {
                fd_ = fd;
            } else {
                ::close(fd);
            }
        }
        freeaddrinfo(res);
        if (fd_ < 0) return false;

        if (url.tls) {
            set_io_timeout(timeout_secs);
            if (!start_tls(url.host)) return false;
        }

        // 1-second slices so the abort flag is polled while waiting for data.
        set_io_timeout(1);
        return true;
    }

    // >0 bytes read, 0 on EOF, -1 on error or abort.
    ssize_t read_some(char* buf, size_t len) {
        while (!aborted()) {
            if (ssl_) {
                int n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
                if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue;
                return n == 0 ? 0 : -1;
            }
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return -1;
        }
        return -1;
    }

    bool write_all(const std::string& data) {
        const char* buf = data.data();
        size_t len = data.size();
        while (len > 0) {
            if (aborted()) return false;
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) continue;
                    return false;
                }
            } else {
                n = ::send(fd_, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    static bool connect_with_timeout(int fd, const addrinfo* ai, long timeout_secs) {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0) {
            if (errno != EINPROGRESS) return false;
            struct pollfd pfd{fd, POLLOUT, 0};
            rc = ::poll(&pfd, 1, static_cast<int>(timeout_secs * 1000));
            if (rc <= 0) return false;
            int err = 0;
            socklen_t elen = sizeof(err);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
            if (err != 0) return false;
        }
        fcntl(fd, F_SETFL, flags);
        return true;
    }

    bool start_tls(const std::string& host) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, host.c_str()); // SNI
        SSL_set1_host(ssl_, host.c_str());
        return SSL_connect(ssl_) == 1;
    }

    void set_io_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                 const ParsedUrl& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.target + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    if (method == "POST")
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    // Status line + headers. Returns 0 when no valid status line arrived.
    long read_head() {
        std::string status_line;
        if (!read_line(status_line)) return 0;

        // "HTTP/1.1 200 OK"
        size_t sp = status_line.find(' ');
        if (sp == std::string::npos || status_line.size() < sp + 4) return 0;
        long status = std::strtol(status_line.substr(sp + 1, 3).c_str(), nullptr, 10);
        if (status < 100 || status > 599) return 0;

        std::string line;
        while (read_line(line) && !line.empty()) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name  = to_lower(trim(line.substr(0, colon)));
            std::string value = to_lower(trim(line.substr(colon + 1)));
            if (name == "transfer-encoding") {
                chunked_ = value.find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                content_length_ = std::strtoull(value.c_str(), nullptr, 10);
                has_length_ = true;
            }
        }
        return status;
    }

    std::string read_body() {
        std::string body;
        if (chunked_) {
            std::string size_line;
            while (read_line(size_line) && !size_line.empty()) {
                // Chunk size is hex, may carry extensions after ';'
                size_t chunk = std::strtoul(size_line.c_str(), nullptr, 16);
                if (chunk == 0) break;
                if (!read_exactly(chunk, body)) break;
                std::string crlf;
                if (!read_exactly(2, crlf)) break;
            }
        } else if (has_length_) {
            read_exactly(content_length_, body);
        } else {
            body.swap(buffer_);
            char buf[4096];
            ssize_t n;
            while ((n = conn_.read_some(buf, sizeof(buf))) > 0)
                body.append(buf, static_cast<size_t>(n));
        }
        return body;
    }

private:
    bool fill() {
        char buf[4096];
        ssize_t n = conn_.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        buffer_.append(buf, static_cast<size_t>(n));
        return true;
    }

    bool read_line(std::string& line) {
        size_t pos;
        while ((pos = buffer_.find('\n')) == std::string::npos) {
            if (!fill()) return false;
        }
        line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    bool read_exactly(size_t n, std::string& out) {
        while (buffer_.size() < n) {
            if (!fill()) {
                out += buffer_;
                buffer_.clear();
                return false;
            }
        }
        out.append(buffer_, 0, n);
        buffer_.erase(0, n);
        return true;
    }

    Connection& conn_;
    std::string buffer_;
    bool chunked_ = false;
    bool has_length_ = false;
    size_t content_length_ = 0;
};

// ── Core request executor ──────────────────────────────────────

static HttpResponse do_request(const std::string& method,
                               const std::string& url_str,
                               const std::string& body,
                               const std::vector<Header>& headers,
                               long timeout_secs) {
    auto url = parse_url(url_str);
    if (!url) return {};

    Connection conn;
    if (!conn.open(*url, timeout_secs)) return {};
    if (!conn.write_all(build_request(method, *url, body, headers))) return {};

    ResponseReader reader(conn);
    HttpResponse resp;
    resp.status_code = reader.read_head();
    if (resp.status_code == 0) return {};
    resp.body = reader.read_body();
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return do_request("POST", url, body, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::get(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return do_request("GET", url, "", headers, timeout_seconds);
}

} // namespace genstream

#endif // __linux__
