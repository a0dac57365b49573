#pragma once
// In-process capture backend for tests: frames are pushed by the test
// (from whatever thread plays "backend task") instead of a real pipeline.
#include <atomic>
#include <cstdint>

#include <opencv2/core.hpp>

#include "msg/Color.hpp"
#include "msg/RgbFrame.hpp"
#include "os/rtos.hpp"
#include "platform/ICaptureBackend.hpp"

class FakeCaptureBackend : public platform::ICaptureBackend {
public:
    bool Start(uint32_t width, uint32_t height, FrameCallback on_frame) override {
        ++start_calls;
        if (fail_start) return false;
        m_width = width;
        m_height = height;
        m_on_frame = on_frame;
        m_running.store(true);
        return true;
    }

    void Stop() override {
        ++stop_calls;
        m_running.store(false);
        m_on_frame = nullptr;
    }

    const char* Name() const override { return "fake"; }
    const char* LastError() const override { return fail_start ? "NO_PORTAL" : "OK"; }

    // Deliver one frame as the backend thread would.
    void Push(const msg::RgbFrame& f) {
        if (m_running.load() && m_on_frame) m_on_frame(f);
    }

    bool running() const { return m_running.load(); }
    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }

    bool fail_start = false;
    int start_calls = 0;
    int stop_calls = 0;

    // -------- frame builders --------

    static msg::RgbFrame Solid(uint32_t w, uint32_t h, msg::Rgb8 c, uint32_t id = 0) {
        msg::RgbFrame f{};
        f.pixels = cv::Mat(int(h), int(w), CV_8UC3, cv::Scalar(c.r, c.g, c.b));
        f.width = w;
        f.height = h;
        f.frame_id = id;
        f.t_capture_us = Rtos::MonoUs();
        return f;
    }

    // Left half `left`, right half `right` (split at w/2).
    static msg::RgbFrame Split(uint32_t w, uint32_t h, msg::Rgb8 left, msg::Rgb8 right) {
        msg::RgbFrame f = Solid(w, h, left);
        f.pixels(cv::Rect(int(w / 2), 0, int(w - w / 2), int(h))).setTo(cv::Scalar(right.r, right.g, right.b));
        return f;
    }

private:
    FrameCallback m_on_frame;
    std::atomic<bool> m_running{false};
    uint32_t m_width = 0;
    uint32_t m_height = 0;
};

// Poll until the sampler-like object publishes a frame (or timeout).
template <typename Sampler>
bool WaitForFrame(const Sampler& s, uint32_t min_frame_id, int timeout_ms = 1000) {
    const uint64_t deadline = Rtos::MonoUs() + uint64_t(timeout_ms) * 1000ull;
    while (Rtos::MonoUs() < deadline) {
        auto snap = s.Snapshot();
        if (snap && snap->frame_id >= min_frame_id) return true;
        Rtos::SleepMs(1);
    }
    return false;
}
