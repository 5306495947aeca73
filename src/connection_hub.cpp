#include "connection_hub.hpp"
#include "util.hpp"

#include <iostream>
#include <vector>

namespace genstream {

ConnectionHub::ConnectionHub(size_t history_limit)
    : history_limit_(history_limit == 0 ? 1 : history_limit)
{}

std::string ConnectionHub::unique_id() const {
    std::string id;
    do { id = generate_id(); } while (index_.count(id) != 0);
    return id;
}

std::string ConnectionHub::register_subscriber(std::unique_ptr<SubscriberTransport> transport) {
    std::string id = unique_id();
    uint64_t key = next_key_++;
    subscribers_.emplace(key, Subscriber{id, std::move(transport)});
    index_[id] = key;
    std::cerr << "[hub] Client connected: " << id << " (" << subscribers_.size() << " total)\n";

    HubSnapshot snap = snapshot_ ? snapshot_() : HubSnapshot{};
    send_to(id, StreamEvent::data(EventType::ConnectionEstablished, {
        {"status", snap.status},
        {"hasActiveStream", snap.has_active_stream}
    }));
    return id;
}

void ConnectionHub::remove(const std::string& subscriber_id) {
    auto it = index_.find(subscriber_id);
    if (it == index_.end()) return;
    subscribers_.erase(it->second);
    index_.erase(it);
    std::cerr << "[hub] Client disconnected: " << subscriber_id << "\n";
}

bool ConnectionHub::contains(const std::string& subscriber_id) const {
    return index_.count(subscriber_id) != 0;
}

bool ConnectionHub::deliver(uint64_t key, const std::string& payload) {
    auto it = subscribers_.find(key);
    if (it == subscribers_.end()) return false;
    auto& sub = it->second;

    if (!sub.transport->is_open()) {
        remove(std::string(sub.id));
        return false;
    }
    try {
        sub.transport->send(payload);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[hub] Error sending to client " << sub.id << ": " << e.what() << "\n";
    }
    remove(std::string(sub.id));
    return false;
}

void ConnectionHub::record(const StreamEvent& event) {
    HistoryEntry entry;
    entry.id = next_history_id_++;
    entry.type = event_type_name(event.type);
    entry.content = event.body.is_string() ? event.body.get<std::string>() : event.body.dump();
    entry.timestamp = event.timestamp;
    history_.push_back(std::move(entry));
    while (history_.size() > history_limit_) history_.pop_front();
}

void ConnectionHub::broadcast(const StreamEvent& event) {
    if (is_text_event(event.type)) record(event);

    const std::string payload = event.serialize();

    // Snapshot keys: a failing subscriber is erased mid-iteration.
    std::vector<uint64_t> keys;
    keys.reserve(subscribers_.size());
    for (const auto& entry : subscribers_) keys.push_back(entry.first);

    for (uint64_t key : keys) deliver(key, payload);
}

bool ConnectionHub::send_to(const std::string& subscriber_id, const StreamEvent& event) {
    auto it = index_.find(subscriber_id);
    if (it == index_.end()) return false;
    return deliver(it->second, event.serialize());
}

size_t ConnectionHub::replay_history(const std::string& subscriber_id, size_t limit) {
    size_t start = history_.size() > limit ? history_.size() - limit : 0;
    size_t sent = 0;
    for (size_t i = start; i < history_.size(); ++i) {
        const auto& entry = history_[i];
        auto type = parse_event_type(entry.type);
        if (!type) continue;
        StreamEvent ev;
        ev.type = *type;
        ev.body = entry.content;
        ev.timestamp = entry.timestamp;
        if (!send_to(subscriber_id, ev)) break;
        ++sent;
    }
    return sent;
}

} // namespace genstream
