#pragma once
#include "http.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace genstream {

// Start/status call to the video generation service failed: transport
// error, non-2xx status or an unusable body.
class GenerationApiError : public std::runtime_error {
public:
    GenerationApiError(const std::string& what, long status = 0)
        : std::runtime_error(what), status_(status) {}
    long status() const { return status_; }

private:
    long status_;
};

struct StartRequest {
    std::string prompt;
    std::string quality = "high";
    uint32_t duration = 10;
};

struct StartResponse {
    std::string stream_id;
    std::string whep_url;
};

// Client for the external generation API:
//   POST {base}/ai/stream/start        {prompt, quality, duration} → {stream_id, whep_url}
//   GET  {base}/ai/stream/{id}/status
// Blocking; callers run it off the event loop.
class GenerationApi {
public:
    GenerationApi(HttpClient& http, std::string base_url, long timeout_seconds = 15);

    StartResponse start(const StartRequest& request) const;
    nlohmann::json status(const std::string& stream_id) const;

    const std::string& base_url() const { return base_url_; }

private:
    HttpClient& http_;
    std::string base_url_;
    long timeout_seconds_;
};

} // namespace genstream
