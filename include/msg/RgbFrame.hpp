#pragma once
#include <cstdint>
#include <opencv2/core.hpp>

namespace msg {

// One captured frame, already scaled to the sampler's target resolution.
// Pixel coords: origin = top-left; x -> right, y -> down.
struct RgbFrame {
    // CV_8UC3, channel order R,G,B. Owned by this frame (never a view into a
    // backend buffer), so a published frame stays valid after the backend
    // moves on.
    cv::Mat pixels;

    uint32_t width  = 0;      // pixels
    uint32_t height = 0;      // pixels

    uint64_t t_capture_us = 0; // monotonic timestamp at delivery (µs)
    uint32_t frame_id = 0;     // increasing counter, per backend

    bool empty() const { return pixels.empty() || width == 0 || height == 0; }

    // Consistency of header vs. pixel buffer.
    bool consistent() const {
        return !pixels.empty()
            && pixels.type() == CV_8UC3
            && static_cast<uint32_t>(pixels.cols) == width
            && static_cast<uint32_t>(pixels.rows) == height
            && pixels.total() == static_cast<std::size_t>(width) * height;
    }
};

} // namespace msg
