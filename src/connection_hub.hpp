#pragma once
#include "stream_event.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

namespace genstream {

// Delivery endpoint of one subscriber: a WebSocket or an SSE stream.
// The hub never needs to know which.
class SubscriberTransport {
public:
    virtual ~SubscriberTransport() = default;

    // Queue one serialized event. Throws std::runtime_error when the
    // connection can no longer accept data.
    virtual void send(const std::string& payload) = 0;

    virtual bool is_open() const = 0;
};

struct HistoryEntry {
    uint64_t id = 0;
    std::string type;
    std::string content;
    int64_t timestamp = 0;
};

// State reported to a subscriber as soon as it registers.
struct HubSnapshot {
    std::string status = "idle";
    bool has_active_stream = false;
};

// Owns the subscriber registry and the bounded event history. Not
// thread-safe: every call happens on the event loop thread.
class ConnectionHub {
public:
    using SnapshotProvider = std::function<HubSnapshot()>;

    explicit ConnectionHub(size_t history_limit = 50);

    void set_snapshot_provider(SnapshotProvider provider) { snapshot_ = std::move(provider); }

    // Adds the subscriber and unicasts a connection_established snapshot.
    std::string register_subscriber(std::unique_ptr<SubscriberTransport> transport);

    // No-op for unknown ids.
    void remove(const std::string& subscriber_id);

    // Serializes once and delivers to every open subscriber in registration
    // order. Closed or failing subscribers are dropped.
    void broadcast(const StreamEvent& event);

    // Returns false when the subscriber is unknown, closed or failed (and dropped).
    bool send_to(const std::string& subscriber_id, const StreamEvent& event);

    // Send up to `limit` most recent history entries, oldest first, as their
    // original event types. Returns the number delivered.
    size_t replay_history(const std::string& subscriber_id, size_t limit);

    bool contains(const std::string& subscriber_id) const;
    size_t subscriber_count() const { return subscribers_.size(); }
    const std::deque<HistoryEntry>& history() const { return history_; }
    size_t history_limit() const { return history_limit_; }

private:
    struct Subscriber {
        std::string id;
        std::unique_ptr<SubscriberTransport> transport;
    };

    bool deliver(uint64_t key, const std::string& payload);
    void record(const StreamEvent& event);
    std::string unique_id() const;

    size_t history_limit_;
    SnapshotProvider snapshot_;

    // Keyed by registration order so fan-out order is stable.
    std::map<uint64_t, Subscriber> subscribers_;
    std::unordered_map<std::string, uint64_t> index_;
    uint64_t next_key_ = 1;

    std::deque<HistoryEntry> history_;
    uint64_t next_history_id_ = 1;
};

} // namespace genstream
