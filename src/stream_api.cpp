#include "stream_api.hpp"
#include "util.hpp"

#include <iostream>

using json = nlohmann::json;

namespace genstream {

static HttpReply json_reply(int status, const json& body) {
    HttpReply r;
    r.status = status;
    r.body = body.dump();
    return r;
}

StreamApi::StreamApi(ConnectionHub& hub, FrameRelay& relay, GenerationOrchestrator& orchestrator,
                     const SignalingClient& signaling, size_t history_replay)
    : hub_(hub)
    , relay_(relay)
    , orchestrator_(orchestrator)
    , signaling_(signaling)
    , history_replay_(history_replay)
{}

json StreamApi::health() const {
    return {
        {"status", "healthy"},
        {"timestamp", timestamp_now()},
        {"connections", hub_.subscriber_count()},
        {"streamStatus", orchestrator_.state_name()}
    };
}

json StreamApi::stream_status() const {
    return {
        {"streamStatus", orchestrator_.state_name()},
        {"hasActiveStream", orchestrator_.has_active_stream()},
        {"frameStreaming", relay_.is_live()}
    };
}

json StreamApi::status() const {
    json j = stream_status();
    j["connectedClients"] = hub_.subscriber_count();
    j["messagesCount"] = hub_.history().size();
    j["hasCurrentFrame"] = relay_.has_current_frame();
    j["framesRelayed"] = relay_.frames_relayed();
    j["targetFrameRate"] = relay_.target_frame_rate();

    const auto& session = orchestrator_.session();
    if (session && !session->id.empty()) {
        json current = {{"id", session->id}, {"prompt", session->prompt}};
        if (session->started_at) {
            current["startTime"] = *session->started_at;
            current["duration"] = epoch_millis() - *session->started_at;
        } else {
            current["startTime"] = nullptr;
            current["duration"] = nullptr;
        }
        j["currentStream"] = current;
    } else {
        j["currentStream"] = nullptr;
    }
    if (orchestrator_.last_status())
        j["lastStatusCheck"] = *orchestrator_.last_status();
    j["signaling"] = signaling_.get_state().to_json();
    return j;
}

HttpReply StreamApi::generate(const HttpRequest& req) {
    json body;
    try {
        body = json::parse(req.body);
    } catch (const json::parse_error&) {
        return json_reply(400, {{"error", "Invalid JSON body"}});
    }
    if (!body.is_object() || !body.contains("prompt") || !body["prompt"].is_string() ||
        body["prompt"].get<std::string>().empty()) {
        return json_reply(400, {{"error", "Prompt is required"}});
    }

    std::string prompt = body["prompt"].get<std::string>();
    bool accepted = orchestrator_.request_generation(prompt);
    return json_reply(200, {
        {"message", "Generation requested"},
        {"prompt", prompt},
        {"accepted", accepted}
    });
}

HttpReply StreamApi::handle(const HttpRequest& req) {
    if (req.method == "OPTIONS") {
        HttpReply r;
        r.status = 204;
        return r;
    }
    if (req.method == "GET" && req.path == "/health") return json_reply(200, health());
    if (req.method == "GET" && req.path == "/api/status") return json_reply(200, status());
    if (req.method == "POST" && req.path == "/api/generate") return generate(req);
    return json_reply(404, {{"error", "Not found"}});
}

std::string StreamApi::subscribe(std::unique_ptr<SubscriberTransport> transport) {
    std::string id = hub_.register_subscriber(std::move(transport));
    if (!id.empty() && history_replay_ > 0)
        hub_.replay_history(id, history_replay_);
    return id;
}

void StreamApi::on_client_message(const std::string& subscriber_id, const std::string& text) {
    json msg;
    try {
        msg = json::parse(text);
    } catch (const json::parse_error& e) {
        std::cerr << "[server] Error parsing client message: " << e.what() << "\n";
        return;
    }
    std::string type;
    if (msg.is_object() && msg.contains("type") && msg["type"].is_string())
        type = msg["type"].get<std::string>();

    if (type == "start_generation") {
        if (msg.contains("prompt") && msg["prompt"].is_string() &&
            !msg["prompt"].get<std::string>().empty()) {
            orchestrator_.request_generation(msg["prompt"].get<std::string>());
        }
    } else if (type == "stop_generation") {
        orchestrator_.stop_current_generation();
    } else if (type == "get_status") {
        hub_.send_to(subscriber_id, StreamEvent::data(EventType::StatusResponse, stream_status()));
    } else {
        std::cerr << "[server] Unknown message type from client " << subscriber_id << ": "
                  << (type.empty() ? "(none)" : type) << "\n";
    }
}

void StreamApi::on_subscriber_closed(const std::string& subscriber_id) {
    hub_.remove(subscriber_id);
}

StreamServer::Handlers StreamApi::handlers() {
    StreamServer::Handlers h;
    h.on_request = [this](const HttpRequest& req) { return handle(req); };
    h.on_subscribe = [this](std::unique_ptr<SubscriberTransport> t) { return subscribe(std::move(t)); };
    h.on_close = [this](const std::string& id) { on_subscriber_closed(id); };
    return h;
}

WsServer::Handlers StreamApi::ws_handlers() {
    WsServer::Handlers h;
    h.on_subscribe = [this](std::unique_ptr<SubscriberTransport> t) { return subscribe(std::move(t)); };
    h.on_message = [this](const std::string& id, const std::string& text) {
        on_client_message(id, text);
    };
    h.on_close = [this](const std::string& id) { on_subscriber_closed(id); };
    return h;
}

} // namespace genstream
