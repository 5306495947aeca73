#include "generation_api.hpp"

using json = nlohmann::json;

namespace genstream {

static std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

GenerationApi::GenerationApi(HttpClient& http, std::string base_url, long timeout_seconds)
    : http_(http)
    , base_url_(strip_trailing_slash(std::move(base_url)))
    , timeout_seconds_(timeout_seconds)
{}

StartResponse GenerationApi::start(const StartRequest& request) const {
    json body = {
        {"prompt", request.prompt},
        {"quality", request.quality},
        {"duration", request.duration}
    };

    auto response = http_.post(base_url_ + "/ai/stream/start", body.dump(),
                               {{"Content-Type", "application/json"}}, timeout_seconds_);
    if (response.status_code == 0)
        throw GenerationApiError("Video API unreachable at " + base_url_);
    if (!response.ok())
        throw GenerationApiError("Video API responded with status: " +
                                 std::to_string(response.status_code), response.status_code);

    json parsed;
    try {
        parsed = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw GenerationApiError(std::string("Video API returned invalid JSON: ") + e.what(),
                                 response.status_code);
    }

    StartResponse result;
    if (parsed.is_object()) {
        if (parsed.contains("stream_id") && parsed["stream_id"].is_string())
            result.stream_id = parsed["stream_id"].get<std::string>();
        if (parsed.contains("whep_url") && parsed["whep_url"].is_string())
            result.whep_url = parsed["whep_url"].get<std::string>();
    }
    if (result.stream_id.empty() || result.whep_url.empty())
        throw GenerationApiError("Video API response missing stream_id or whep_url",
                                 response.status_code);
    return result;
}

json GenerationApi::status(const std::string& stream_id) const {
    auto response = http_.get(base_url_ + "/ai/stream/" + stream_id + "/status",
                              {{"Accept", "application/json"}}, timeout_seconds_);
    if (!response.ok())
        throw GenerationApiError("Stream status check failed (HTTP " +
                                 std::to_string(response.status_code) + ")",
                                 response.status_code);
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw GenerationApiError(std::string("Stream status is not JSON: ") + e.what(),
                                 response.status_code);
    }
}

} // namespace genstream
