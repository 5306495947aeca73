#pragma once
#include "http.hpp"
#include <mutex>
#include <vector>

namespace genstream {

class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    std::vector<HttpResponse> response_queue;
    std::string last_method;
    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    int call_count = 0;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long /*timeout_seconds*/) override {
        return record("POST", url, body, headers);
    }

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long /*timeout_seconds*/) override {
        return record("GET", url, "", headers);
    }

    std::string header(const std::string& name) const {
        for (const auto& h : last_headers)
            if (h.first == name) return h.second;
        return "";
    }

private:
    HttpResponse record(const std::string& method, const std::string& url,
                        const std::string& body, const std::vector<Header>& headers) {
        std::lock_guard<std::mutex> lock(mutex_);
        call_count++;
        last_method = method;
        last_url = url;
        last_body = body;
        last_headers = headers;
        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }

    std::mutex mutex_;
};

} // namespace genstream
