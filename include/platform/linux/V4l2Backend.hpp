#pragma once
#include <atomic>
#include <cstdint>
#include <cstddef>

#include "os/rtos.hpp"
#include "platform/ICaptureBackend.hpp"

namespace platform {
static constexpr uint32_t V4L2_MAX_BUFS = 16;
}

namespace platform {

// ------------------------------
// Config
// ------------------------------
struct V4l2Config {

    // V4L2 Device Node (HDMI grabber, webcam, v4l2loopback, ...)
    const char* dev = "/dev/video0";

    // Native capture size requested from the driver. The driver may adjust it;
    // frames are scaled to the sampler's target size anyway.
    uint32_t width  = 640;
    uint32_t height = 480;

    // V4L2 pixelformat fourcc. Stored as uint32_t to avoid linux headers here.
    // Supported: YUYV, RGB24, BGR24. 0 = YUYV.
    uint32_t v4l2_pixfmt = 0;

    // How many MMAP buffers to request via VIDIOC_REQBUFS.
    uint32_t buffer_count = 4;

    // poll() timeout; bounds how long Stop() waits for the capture task.
    uint32_t poll_timeout_ms = 200;
};

// ------------------------------
// V4l2Backend: owns V4L2 streaming + mmapped buffers.
// Only the capture task calls DQBUF/QBUF while streaming.
// Each dequeued buffer is converted + scaled into a fresh RGB frame and
// requeued immediately, so the driver never starves.
// ------------------------------
class V4l2Backend : public ICaptureBackend {
public:
    explicit V4l2Backend(const V4l2Config& cfg = {});
    ~V4l2Backend() override;

    // Open device, set+verify format, allocate+map buffers, queue buffers,
    // stream on, start the capture task. Tears down on any failure.
    bool Start(uint32_t width, uint32_t height, FrameCallback on_frame) override;

    // Stop the task, stream off and release all resources.
    // Safe to call even if Start() partially failed.
    void Stop() override;

    const char* Name() const override { return "v4l2"; }
    const char* LastError() const override { return StatusStr(m_status); }
    int LastErrno() const override { return m_errno; }

    // One driver buffer (YUYV, RGB24 or BGR24, `stride` bytes per row) ->
    // owned RGB frame scaled to out_w x out_h. Pixels never alias `data`.
    // Returns false for any other pixel format or a zero size.
    static bool ConvertBuffer(const uint8_t* data, uint32_t width, uint32_t height,
                              uint32_t stride, uint32_t pixfmt,
                              uint32_t out_w, uint32_t out_h, msg::RgbFrame& out);

    // Optional introspection for logging/debug
    uint32_t negotiatedWidth()  const { return m_width; }
    uint32_t negotiatedHeight() const { return m_height; }
    uint32_t negotiatedStride() const { return m_stride; }

    enum class Status : uint8_t {
        OK = 0,
        // SYSCALL FAILS
        OPEN_FAIL,
        QUERYCAP_FAIL,
        SETFMT_FAIL,
        REQBUFS_FAIL,
        QUERYBUF_FAIL,
        MMAP_FAIL,
        QBUF_FAIL,
        STREAMON_FAIL,
        DQBUF_FAIL,
        POLL_FAIL,

        // LOGIC FAILS
        ALREADY_RUNNING,
        BAD_SIZE,
        BAD_BUFF_INDEX,
        UNSUPPORTED_CAPS,
        UNSUPPORTED_FORMAT,
        TASK_FAIL,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    int    lastErrno()  const { return m_errno; }

private:
    struct MmapBuf {
        uint8_t* ptr = nullptr;
        uint32_t len = 0;
    };

    V4l2Config m_cfg{};
    int m_fd = -1; // File descriptor

    // Target (output) size
    uint32_t m_out_width  = 0;
    uint32_t m_out_height = 0;

    // Negotiated format (read back from VIDIOC_G_FMT and stored once)
    uint32_t m_width = 0;
    uint32_t m_height = 0;
    uint32_t m_stride = 0;        // bytes per row (bytesperline)
    uint32_t m_pixfmt = 0;

    // MMAP buffers
    MmapBuf  m_bufs[V4L2_MAX_BUFS]{};
    uint32_t m_buf_count = 0;

    uint32_t m_frame_id = 0;
    bool m_streaming = false;
    bool m_running = false;

    Rtos::Task        m_task;
    FrameCallback     m_on_frame;
    std::atomic<bool> m_stop_requested{false};

    // FDIR
    Status m_status = Status::OK;
    int    m_errno  = 0;

private:
    // Setup helpers
    bool openDevice();
    bool queryCaps();
    bool setAndVerifyFormat();
    bool requestAndMapBuffers();
    bool queueAllBuffers();
    bool streamOn();
    void streamOff();
    void unmapBuffers();
    void closeDevice();
    void teardown();

    // Task
    static void TaskEntry(void* arg);
    void Run();

    // One dequeue -> convert -> requeue -> publish. Returns false on ioctl failure.
    bool captureOne();
    bool requeue(uint32_t idx);

    // Fail
    bool fail(Status s);
};

} // namespace platform
