#pragma once
#include "http.hpp"
#include <chrono>
#include <mutex>
#include <thread>

namespace llmgw {

class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    std::vector<HttpResponse> response_queue;
    std::string last_method;
    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    HttpRequestOptions last_options;
    std::chrono::milliseconds delay{0};   // simulated server latency
    int call_count = 0;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      const HttpRequestOptions& options) override {
        return record("POST", url, body, headers, options);
    }

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     const HttpRequestOptions& options) override {
        return record("GET", url, "", headers, options);
    }

private:
    HttpResponse record(const std::string& method,
                        const std::string& url,
                        const std::string& body,
                        const std::vector<Header>& headers,
                        const HttpRequestOptions& options) {
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        std::lock_guard<std::mutex> lock(mutex_);
        call_count++;
        last_method = method;
        last_url = url;
        last_body = body;
        last_headers = headers;
        last_options = options;
        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }

    std::mutex mutex_;
};

} // namespace llmgw
