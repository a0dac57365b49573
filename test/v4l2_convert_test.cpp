// test/v4l2_convert_test.cpp
// Driver-buffer -> RgbFrame conversion, without a device.
#include <cstdint>
#include <cstring>
#include <iostream>
#include <vector>

// Only the test needs videodev2.h to get V4L2_PIX_FMT_* constants.
#include <linux/videodev2.h>

#include "platform/linux/V4l2Backend.hpp"

static int g_fail = 0;

static void check(bool ok, const char* what) {
    std::cout << "  " << (ok ? "PASS" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_fail;
}

static bool px(const msg::RgbFrame& f, int x, int y, int r, int g, int b) {
    const cv::Vec3b p = f.pixels.at<cv::Vec3b>(y, x);
    return p[0] == r && p[1] == g && p[2] == b;
}

int main() {
    using platform::V4l2Backend;

    std::cout << "=== v4l2_convert_test ===\n";

    std::cout << "\n[Test 1] BGR24 -> RGB channel order\n";
    {
        // 2x1: (B,G,R) = (10,20,30), (200,100,50)
        std::vector<uint8_t> buf = {10, 20, 30, 200, 100, 50};
        msg::RgbFrame f{};
        check(V4l2Backend::ConvertBuffer(buf.data(), 2, 1, 6, V4L2_PIX_FMT_BGR24, 2, 1, f), "converted");
        check(f.consistent() && f.width == 2 && f.height == 1, "2x1 RGB frame");
        check(px(f, 0, 0, 30, 20, 10), "pixel 0 swapped to RGB");
        check(px(f, 1, 0, 50, 100, 200), "pixel 1 swapped to RGB");
    }

    std::cout << "\n[Test 2] RGB24 with row padding\n";
    {
        // 2x2, stride 8 (2 bytes padding per row filled with 0xEE)
        std::vector<uint8_t> buf = {
            1, 2, 3,   4, 5, 6,   0xEE, 0xEE,
            7, 8, 9,  10, 11, 12, 0xEE, 0xEE,
        };
        msg::RgbFrame f{};
        check(V4l2Backend::ConvertBuffer(buf.data(), 2, 2, 8, V4L2_PIX_FMT_RGB24, 2, 2, f), "converted");
        check(px(f, 0, 0, 1, 2, 3) && px(f, 1, 0, 4, 5, 6), "row 0");
        check(px(f, 0, 1, 7, 8, 9) && px(f, 1, 1, 10, 11, 12), "row 1 skips the padding");
        check(f.pixels.isContinuous(), "output is tightly packed");
    }

    std::cout << "\n[Test 3] Output never aliases the driver buffer\n";
    {
        std::vector<uint8_t> buf = {1, 2, 3, 4, 5, 6};
        msg::RgbFrame f{};
        check(V4l2Backend::ConvertBuffer(buf.data(), 2, 1, 6, V4L2_PIX_FMT_RGB24, 2, 1, f), "converted");

        const uint8_t* lo = buf.data();
        const uint8_t* hi = buf.data() + buf.size();
        check(f.pixels.data < lo || f.pixels.data >= hi, "pixels live outside the buffer");

        std::memset(buf.data(), 0xFF, buf.size());   // driver reuses the buffer
        check(px(f, 0, 0, 1, 2, 3) && px(f, 1, 0, 4, 5, 6), "frame unchanged after buffer reuse");
    }

    std::cout << "\n[Test 4] YUYV\n";
    {
        // 2x1 macropixel: Y0 U Y1 V
        std::vector<uint8_t> gray = {128, 128, 128, 128};
        msg::RgbFrame g{};
        check(V4l2Backend::ConvertBuffer(gray.data(), 2, 1, 4, V4L2_PIX_FMT_YUYV, 2, 1, g), "converted gray");
        const cv::Vec3b p = g.pixels.at<cv::Vec3b>(0, 0);
        check(p[0] == p[1] && p[1] == p[2], "neutral chroma -> r == g == b");
        check(p[0] > 100 && p[0] < 160, "mid-level Y -> mid gray");

        // BT.601 red: Y=81 U=90 V=240
        std::vector<uint8_t> red = {81, 90, 81, 240};
        msg::RgbFrame r{};
        check(V4l2Backend::ConvertBuffer(red.data(), 2, 1, 4, V4L2_PIX_FMT_YUYV, 2, 1, r), "converted red");
        const cv::Vec3b q = r.pixels.at<cv::Vec3b>(0, 1);
        check(q[0] > 200 && q[1] < 50 && q[2] < 50, "red lands in the R channel");
    }

    std::cout << "\n[Test 5] Scaled to the target size\n";
    {
        std::vector<uint8_t> buf(4 * 2 * 3);
        for (size_t i = 0; i < buf.size(); i += 3) { buf[i] = 40; buf[i + 1] = 80; buf[i + 2] = 120; }
        msg::RgbFrame f{};
        check(V4l2Backend::ConvertBuffer(buf.data(), 4, 2, 12, V4L2_PIX_FMT_RGB24, 2, 1, f), "converted");
        check(f.consistent() && f.width == 2 && f.height == 1, "2x1 output");
        check(px(f, 0, 0, 40, 80, 120) && px(f, 1, 0, 40, 80, 120), "uniform color preserved");
    }

    std::cout << "\n[Test 6] Rejected input\n";
    {
        std::vector<uint8_t> buf(64, 0);
        msg::RgbFrame f{};
        check(!V4l2Backend::ConvertBuffer(buf.data(), 2, 2, 0, V4L2_PIX_FMT_MJPEG, 2, 2, f), "MJPEG unsupported");
        check(!V4l2Backend::ConvertBuffer(buf.data(), 4, 2, 8, V4L2_PIX_FMT_RGB24, 4, 2, f), "stride shorter than a row");
        check(!V4l2Backend::ConvertBuffer(nullptr, 2, 2, 6, V4L2_PIX_FMT_RGB24, 2, 2, f), "null buffer");
        check(!V4l2Backend::ConvertBuffer(buf.data(), 2, 2, 6, V4L2_PIX_FMT_RGB24, 0, 2, f), "zero target size");
        check(f.empty(), "output untouched");
    }

    std::cout << "\nv4l2_convert_test: " << (g_fail ? "FAIL" : "PASS") << "\n";
    return g_fail ? 1 : 0;
}
