#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include <opencv2/videoio.hpp>

#include "os/rtos.hpp"
#include "platform/ICaptureBackend.hpp"

namespace platform {

// ------------------------------
// Config
// ------------------------------
struct ScreenCastConfig {
    // GStreamer source element. media.role=Screen makes PipeWire go through
    // the desktop screen-sharing portal, which asks the user for a screen or
    // window. keepalive-time re-sends the last buffer while the screen is
    // static so the reader never stalls for long.
    std::string source =
        "pipewiresrc stream-properties=\"properties,media.role=Screen\" keepalive-time=1000";

    // After this many consecutive empty reads the stream is reported lost
    // (logged once); reading continues.
    uint32_t max_empty_reads = 50;
};

// ------------------------------
// ScreenCastBackend: screen/window capture through an OpenCV VideoCapture
// on a GStreamer pipeline. The appsink holds at most one buffer and drops
// anything unconsumed, so every read returns the newest frame.
// Only the capture task touches m_cap between Start() and Stop().
// ------------------------------
class ScreenCastBackend : public ICaptureBackend {
public:
    explicit ScreenCastBackend(const ScreenCastConfig& cfg = {});
    ~ScreenCastBackend() override;

    bool Start(uint32_t width, uint32_t height, FrameCallback on_frame) override;
    void Stop() override;

    const char* Name() const override { return "screen"; }
    const char* LastError() const override { return StatusStr(m_status); }

    // Full launch string for the given target size (exposed for logging/tests).
    std::string PipelineString(uint32_t width, uint32_t height) const;

    enum class Status : uint8_t {
        OK = 0,
        ALREADY_RUNNING,
        BAD_SIZE,
        OPEN_FAIL,      // pipeline could not reach PLAYING (no portal, denied, negotiation)
        TASK_FAIL,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    static void TaskEntry(void* arg);
    void Run();

    bool fail(Status s);

    ScreenCastConfig m_cfg{};

    cv::VideoCapture m_cap;
    Rtos::Task       m_task;
    FrameCallback    m_on_frame;

    uint32_t m_width  = 0;
    uint32_t m_height = 0;
    uint32_t m_frame_id = 0;

    bool m_running = false;
    std::atomic<bool> m_stop_requested{false};

    // FDIR
    Status m_status = Status::OK;
};

} // namespace platform
