#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace llmgw {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;       // 0: no HTTP response (connect/transport failure)
    std::string body;
    bool timed_out = false;     // timeout elapsed or abort flag raised
    std::string error;          // transport failure description
};

struct HttpRequestOptions {
    std::chrono::milliseconds timeout{30000};   // whole exchange, connect included
    const std::atomic<bool>* abort = nullptr;   // polled while waiting on the socket
};

// Abstract HTTP client interface (injectable for testing).
// Implementations must be safe to use from several threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              const HttpRequestOptions& options) = 0;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             const HttpRequestOptions& options) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt selects the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      const HttpRequestOptions& options) override;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     const HttpRequestOptions& options) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Elsewhere: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      const HttpRequestOptions& options) override;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     const HttpRequestOptions& options) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace llmgw
