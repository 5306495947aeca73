#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace genstream {

// Wire "type" of a subscriber event.
enum class EventType {
    ConnectionEstablished,
    Thought,
    Prompt,
    VideoGeneration,   // generation_status
    Error,
    Frame,
    WaitingFrame,
    StatusResponse,
};

const char* event_type_name(EventType type);
std::optional<EventType> parse_event_type(const std::string& name);

// Text events carry "content" and are kept in the hub history;
// the rest carry a structured "data" object.
bool is_text_event(EventType type);

// One outbound event: {"type": ..., "content"|"data": ..., "timestamp": ms}
struct StreamEvent {
    EventType type = EventType::VideoGeneration;
    nlohmann::json body;
    int64_t timestamp = 0;

    static StreamEvent text(EventType type, std::string content);
    static StreamEvent data(EventType type, nlohmann::json data);

    nlohmann::json to_json() const;
    std::string serialize() const { return to_json().dump(); }
};

} // namespace genstream
