#include "stream_event.hpp"
#include "util.hpp"

namespace genstream {

const char* event_type_name(EventType type) {
    switch (type) {
        case EventType::ConnectionEstablished: return "connection_established";
        case EventType::Thought:               return "thought";
        case EventType::Prompt:                return "prompt";
        case EventType::VideoGeneration:       return "video_generation";
        case EventType::Error:                 return "error";
        case EventType::Frame:                 return "frame";
        case EventType::WaitingFrame:          return "waiting_frame";
        case EventType::StatusResponse:        return "status_response";
    }
    return "unknown";
}

std::optional<EventType> parse_event_type(const std::string& name) {
    static const EventType all[] = {
        EventType::ConnectionEstablished, EventType::Thought, EventType::Prompt,
        EventType::VideoGeneration, EventType::Error, EventType::Frame,
        EventType::WaitingFrame, EventType::StatusResponse,
    };
    for (EventType t : all) {
        if (name == event_type_name(t)) return t;
    }
    return std::nullopt;
}

bool is_text_event(EventType type) {
    return type == EventType::Thought || type == EventType::Prompt ||
           type == EventType::VideoGeneration || type == EventType::Error;
}

StreamEvent StreamEvent::text(EventType type, std::string content) {
    StreamEvent ev;
    ev.type = type;
    ev.body = std::move(content);
    ev.timestamp = epoch_millis();
    return ev;
}

StreamEvent StreamEvent::data(EventType type, nlohmann::json data) {
    StreamEvent ev;
    ev.type = type;
    ev.body = std::move(data);
    ev.timestamp = epoch_millis();
    return ev;
}

nlohmann::json StreamEvent::to_json() const {
    nlohmann::json j;
    j["type"] = event_type_name(type);
    j[is_text_event(type) ? "content" : "data"] = body;
    j["timestamp"] = timestamp;
    return j;
}

} // namespace genstream
