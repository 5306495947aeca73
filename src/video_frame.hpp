#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace genstream {

// One unit of inbound media, as handed over by the media pipeline.
struct VideoFrame {
    std::string session_id;     // stamped by the orchestrator before relaying
    uint64_t sequence = 0;      // strictly increasing within a session
    int64_t captured_at = 0;    // epoch ms
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> payload;
};

} // namespace genstream
