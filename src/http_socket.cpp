// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Same interface behaviour as http_curl.cpp: http_init/cleanup are no-ops
// (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <cerrno>
#include <string>
#include <stdexcept>

namespace llmgw {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

// Socket waits are cut into slices so abort and deadline are noticed promptly.
static constexpr long kSliceMs = 100;

void http_init() {}
void http_cleanup() {}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::invalid_argument("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw std::invalid_argument("unsupported URL scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::invalid_argument("invalid URL: " + url);
    return result;
}

static struct timeval to_timeval(long ms) {
    if (ms < 1) ms = 1;
    struct timeval tv{};
    tv.tv_sec = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    return tv;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    Clock::time_point deadline;
    const std::atomic<bool>* abort = nullptr;
    bool timed_out = false;

    Connection(Clock::time_point deadline, const std::atomic<bool>* abort)
        : deadline(deadline), abort(abort) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    long remaining_ms() const {
        auto left = std::chrono::duration_cast<milliseconds>(deadline - Clock::now()).count();
        return left > 0 ? static_cast<long>(left) : 0;
    }

    // Deadline passed or caller gave up; records the reason.
    bool expired() {
        if ((abort && abort->load(std::memory_order_relaxed)) || remaining_ms() == 0) {
            timed_out = true;
            return true;
        }
        return false;
    }

    bool connect(const ParsedUrl& url, std::string& error) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0) {
            error = "cannot resolve host " + url.host;
            return false;
        }

        bool connected = false;
        for (auto* ai = res; ai && !connected && !expired(); ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so the deadline and abort flag are honoured.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                while (!expired()) {
                    fd_set wset;
                    FD_ZERO(&wset);
                    FD_SET(fd, &wset);
                    struct timeval tv = to_timeval(std::min(kSliceMs, remaining_ms()));
                    rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                    if (rc == 0) continue;
                    if (rc > 0) {
                        int err = 0;
                        socklen_t elen = sizeof(err);
                        getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                        if (err == 0) {
                            fcntl(fd, F_SETFL, flags);
                            connected = true;
                        }
                    }
                    break;
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) {
            error = timed_out ? "connect timed out" : "cannot connect to " + url.host + ":" + url.port;
            return false;
        }

        // Handshake gets whatever time is left, then switch to short slices
        // so abort-flag checks work while waiting for the response.
        if (url.tls) {
            set_socket_timeout(remaining_ms());

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "SSL_CTX_new failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "SSL_new failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                error = expired() ? "TLS handshake timed out" : "TLS handshake failed";
                return false;
            }
        }

        set_socket_timeout(kSliceMs);
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error or expiry.
    // EAGAIN (slice expiry) loops back to re-check abort and deadline.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (expired()) return -1;

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // slice expired
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (expired()) return false;
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long ms) {
        struct timeval tv = to_timeval(ms);
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (method == "POST" && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
static std::string read_line(Connection& conn, std::string& leftover) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            std::string line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return "";
        leftover.append(buf, static_cast<size_t>(n));
    }
}

// Parse status line + headers; populates is_chunked / content_length.
static long parse_response_headers(Connection& conn, std::string& leftover,
                                    bool& is_chunked, size_t& content_length) {
    is_chunked     = false;
    content_length = 0;

    std::string status_line = read_line(conn, leftover);
    if (status_line.empty()) return 0;

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return 0;
    long status = std::strtol(status_line.c_str() + sp1 + 1, nullptr, 10);
    if (status < 100 || status > 999) return 0;

    while (true) {
        std::string line = read_line(conn, leftover);
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding")
            is_chunked = (value.find("chunked") != std::string::npos);
        else if (name == "content-length")
            content_length = std::strtoul(value.c_str(), nullptr, 10);
    }
    return status;
}

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(Connection& conn, std::string& leftover,
                          size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

static void read_until_eof(Connection& conn, std::string& leftover,
                            std::string& out) {
    out += leftover;
    leftover.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
}

// Accumulate full body (handles chunked + content-length + read-to-close).
static std::string read_body(Connection& conn, std::string& leftover,
                              bool is_chunked, size_t content_length) {
    std::string body;
    if (is_chunked) {
        for (;;) {
            std::string size_line = read_line(conn, leftover);
            if (size_line.empty()) break;
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) break;
            if (!read_exactly(conn, leftover, chunk_size, body)) break;
            std::string crlf;
            read_exactly(conn, leftover, 2, crlf); // trailing \r\n
        }
    } else if (content_length > 0) {
        read_exactly(conn, leftover, content_length, body);
    } else {
        read_until_eof(conn, leftover, body);
    }
    return body;
}

// ── Core request executor ──────────────────────────────────────

static HttpResponse do_request(const std::string& method,
                                const std::string& url_str,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                const HttpRequestOptions& options) {
    HttpResponse resp;
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::invalid_argument& e) {
        resp.error = e.what();
        return resp;
    }

    Connection conn(Clock::now() + options.timeout, options.abort);
    if (!conn.connect(url, resp.error)) {
        resp.timed_out = conn.timed_out;
        return resp;
    }

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        resp.timed_out = conn.timed_out;
        resp.error = resp.timed_out ? "request timed out" : "write failed";
        return resp;
    }

    std::string leftover;
    bool   is_chunked     = false;
    size_t content_length = 0;
    long status = parse_response_headers(conn, leftover, is_chunked, content_length);
    if (status == 0) {
        resp.timed_out = conn.timed_out;
        resp.error = resp.timed_out ? "response timed out" : "malformed or missing response";
        return resp;
    }

    resp.status_code = status;
    resp.body = read_body(conn, leftover, is_chunked, content_length);
    if (conn.timed_out) {
        // Partial body: report as a timeout rather than a truncated success.
        resp.timed_out = true;
        resp.status_code = 0;
        resp.error = "response body timed out";
    }
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     const HttpRequestOptions& options) {
    return do_request("POST", url, body, headers, options);
}

HttpResponse SocketHttpClient::get(const std::string& url,
                                    const std::vector<Header>& headers,
                                    const HttpRequestOptions& options) {
    return do_request("GET", url, "", headers, options);
}

} // namespace llmgw

#endif // __linux__
