#pragma once
#include <atomic>
#include <cstdint>
#include <memory>

#include "os/rtos.hpp"
#include "msg/Color.hpp"
#include "msg/RgbFrame.hpp"
#include "platform/ICaptureBackend.hpp"

namespace screen {

// ------------------------------
// Queue types (keep them explicit and boring)
// ------------------------------
using LiveFrameQueue = Rtos::Queue<msg::RgbFrame, 1>;   // freshest-wins

// ------------------------------
// Config
// ------------------------------
struct FrameSamplerConfig {
    // Target frame size requested from the backend. Constant for the
    // sampler's lifetime; frames of any other size are dropped.
    uint32_t width  = 160;
    uint32_t height = 90;

    // Acquisition task wakes at least this often to check for Close().
    uint32_t recv_timeout_ms = 100;
};

// ------------------------------
// FrameSampler: keeps the newest frame of a live capture backend and answers
// region-average color queries against it.
//
// Threads:
//  - backend task:      pushes frames into m_live_q (overwrite, depth 1)
//  - acquisition task:  drains m_live_q, swaps m_latest under m_latest_lock
//  - callers:           GetRegionColor() copies m_latest under the lock and
//                       averages outside it; frames are immutable once published
//
// Start() is the only fallible operation. Close() (also run by the destructor)
// stops the backend first, then the acquisition task.
// ------------------------------
class FrameSampler {
public:
    FrameSampler(platform::ICaptureBackend& backend, const FrameSamplerConfig& cfg = {});
    ~FrameSampler();

    FrameSampler(const FrameSampler&) = delete;
    FrameSampler& operator=(const FrameSampler&) = delete;

    // Start acquisition task + backend. On failure nothing is left running
    // and lastStatus() is CAPTURE_INIT_FAIL (or TASK_FAIL).
    bool Start();

    // Mean color of the fractional rectangle in the newest frame.
    // (0,0,0) if there is no frame yet or the rectangle maps to no pixels.
    // Never blocks on the capture pipeline.
    msg::Rgb8 GetRegionColor(double left, double top, double right, double bottom) const;
    msg::Rgb8 GetRegionColor(const msg::Region& region) const;

    // Idempotent.
    void Close();

    // Newest published frame, or null.
    std::shared_ptr<const msg::RgbFrame> Snapshot() const;

    // Region averaging on a given frame (floor, clamp, mean, truncate).
    static msg::Rgb8 RegionMean(const msg::RgbFrame& frame, const msg::Region& region);

    uint32_t width()  const { return m_cfg.width; }
    uint32_t height() const { return m_cfg.height; }
    bool running() const { return m_running; }

    // Diagnostics
    uint64_t FramesReceived()    const { return m_frames_received.load(); }
    uint64_t FramesOverwritten() const { return m_frames_overwritten.load(); }
    uint64_t FramesRejected()    const { return m_frames_rejected.load(); }

    enum class Status : uint8_t {
        OK = 0,
        ALREADY_RUNNING,
        TASK_FAIL,
        CAPTURE_INIT_FAIL,
    };

    static const char* StatusStr(Status s);
    Status lastStatus() const { return m_status; }

private:
    // Backend thread
    void onFrame(const msg::RgbFrame& f);

    // Acquisition task
    static void TaskEntry(void* arg);
    void Run();
    void publish(const msg::RgbFrame& f);

    void stopTask();
    bool fail(Status s);

    platform::ICaptureBackend& m_backend;
    FrameSamplerConfig m_cfg{};

    LiveFrameQueue m_live_q{/*overwrite=*/true};

    mutable Rtos::Mutex m_latest_lock;
    std::shared_ptr<const msg::RgbFrame> m_latest;

    Rtos::Task m_task;
    std::atomic<bool> m_stop_requested{false};
    bool m_running = false;
    bool m_backend_running = false;

    std::atomic<uint64_t> m_frames_received{0};
    std::atomic<uint64_t> m_frames_overwritten{0};
    std::atomic<uint64_t> m_frames_rejected{0};

    // FDIR
    Status m_status = Status::OK;
};

} // namespace screen
