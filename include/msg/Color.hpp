#pragma once
#include <cstdint>

namespace msg {

// 8-bit sRGB triple (0..255 per channel).
struct Rgb8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    constexpr bool operator==(const Rgb8& o) const { return r == o.r && g == o.g && b == o.b; }
    constexpr bool operator!=(const Rgb8& o) const { return !(*this == o); }
};

// CIE 1931 chromaticity. z = 1 - x - y is implied.
// (0,0) is the defined result for black.
struct ChromaXY {
    double x = 0.0;
    double y = 0.0;
};

// Fractional rectangle over a frame, each edge in [0,1].
// left/top inclusive, right/bottom exclusive once mapped to pixels.
struct Region {
    double left   = 0.0;
    double top    = 0.0;
    double right  = 1.0;
    double bottom = 1.0;
};

} // namespace msg
