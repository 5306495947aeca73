#pragma once
#include "connection_hub.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace genstream {

// What a RecordingTransport saw; outlives the transport, which the hub owns.
struct Recording {
    std::vector<std::string> payloads;
    bool open = true;
    bool fail_sends = false;
    bool destroyed = false;

    nlohmann::json message(size_t i) const { return nlohmann::json::parse(payloads.at(i)); }
    nlohmann::json last() const { return nlohmann::json::parse(payloads.back()); }

    size_t count_type(const std::string& type) const {
        size_t n = 0;
        for (const auto& p : payloads)
            if (nlohmann::json::parse(p).value("type", "") == type) ++n;
        return n;
    }

    std::vector<nlohmann::json> of_type(const std::string& type) const {
        std::vector<nlohmann::json> out;
        for (const auto& p : payloads) {
            auto j = nlohmann::json::parse(p);
            if (j.value("type", "") == type) out.push_back(j);
        }
        return out;
    }
};

class RecordingTransport : public SubscriberTransport {
public:
    explicit RecordingTransport(std::shared_ptr<Recording> rec) : rec_(std::move(rec)) {}
    ~RecordingTransport() override { rec_->destroyed = true; }

    void send(const std::string& payload) override {
        if (rec_->fail_sends) throw std::runtime_error("socket write failed");
        rec_->payloads.push_back(payload);
    }

    bool is_open() const override { return rec_->open; }

private:
    std::shared_ptr<Recording> rec_;
};

inline std::unique_ptr<SubscriberTransport> recording(std::shared_ptr<Recording> rec) {
    return std::make_unique<RecordingTransport>(std::move(rec));
}

} // namespace genstream
