#include "frame_pipeline.hpp"
#include "util.hpp"

namespace genstream {

std::optional<VideoFrame> PassthroughPipeline::process(const uint8_t* data, size_t len,
                                                       uint32_t /*rtp_timestamp*/) {
    if (!data || len == 0) return std::nullopt;
    VideoFrame frame;
    frame.sequence = ++sequence_;
    frame.captured_at = epoch_millis();
    frame.width = width_;
    frame.height = height_;
    frame.payload.assign(data, data + len);
    return frame;
}

} // namespace genstream
