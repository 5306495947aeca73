#pragma once
#include "video_frame.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace genstream {

// Turns depacketized access units from the video track into frames.
// Called from the transport's media thread, one unit at a time.
class FramePipeline {
public:
    virtual ~FramePipeline() = default;
    virtual std::optional<VideoFrame> process(const uint8_t* data, size_t len,
                                              uint32_t rtp_timestamp) = 0;
};

// Forwards each access unit unchanged, tagged with the configured frame size.
// Decoding is left to the subscribers.
class PassthroughPipeline : public FramePipeline {
public:
    PassthroughPipeline(uint32_t width, uint32_t height)
        : width_(width), height_(height) {}

    std::optional<VideoFrame> process(const uint8_t* data, size_t len,
                                      uint32_t rtp_timestamp) override;

private:
    uint32_t width_;
    uint32_t height_;
    uint64_t sequence_ = 0;
};

} // namespace genstream
