// V4l2Backend.cpp
#include "platform/linux/V4l2Backend.hpp"

#include <linux/videodev2.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <errno.h>

#include <iostream>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace {

// Retry ioctl if interrupted by a signal.
// Without it we can get rare failures under load/interrupts.
static int xioctl(int fd, unsigned long req, void* arg) {
    int r;
    do { r = ::ioctl(fd, req, arg); }
    while (r == -1 && errno == EINTR);
    return r;
}

// Container bytes per pixel for the formats we convert.
static uint8_t bytes_per_px_from_pixfmt(uint32_t pixfmt) {
    switch (pixfmt) {
        case V4L2_PIX_FMT_YUYV:  return 2;
        case V4L2_PIX_FMT_RGB24: return 3;
        case V4L2_PIX_FMT_BGR24: return 3;
        default:                 return 0; // unsupported
    }
}

} // anonymous namespace

namespace platform {

static inline V4l2Config sanitise(const V4l2Config& in) {
    V4l2Config cfg = in;

    if (!cfg.dev) cfg.dev = "/dev/video0";

    if (cfg.width == 0)  cfg.width  = 640;
    if (cfg.height == 0) cfg.height = 480;

    if (cfg.v4l2_pixfmt == 0) cfg.v4l2_pixfmt = V4L2_PIX_FMT_YUYV;

    if (cfg.buffer_count < 2) cfg.buffer_count = 2;
    if (cfg.buffer_count > V4L2_MAX_BUFS) cfg.buffer_count = V4L2_MAX_BUFS;

    if (cfg.poll_timeout_ms < 10) cfg.poll_timeout_ms = 10;

    return cfg;
}

V4l2Backend::V4l2Backend(const V4l2Config& cfg)
: m_cfg(sanitise(cfg)) {
    // Reseting any previous errors
    m_status = Status::OK;
    m_errno  = 0;
}

V4l2Backend::~V4l2Backend() {
    Stop();
}

bool V4l2Backend::Start(uint32_t width, uint32_t height, FrameCallback on_frame) {
    if (m_running) return fail(Status::ALREADY_RUNNING);

    // Reseting any previous errors
    m_status = Status::OK;
    m_errno  = 0;

    if (width == 0 || height == 0 || !on_frame) return fail(Status::BAD_SIZE);

    m_out_width  = width;
    m_out_height = height;
    m_on_frame   = std::move(on_frame);

    if (!openDevice()) return false; // OK because openDevice() sets status
    if (!queryCaps()) { teardown(); return false; }
    if (!setAndVerifyFormat()) { teardown(); return false; }
    if (!requestAndMapBuffers()) { teardown(); return false; }
    if (!queueAllBuffers()) { teardown(); return false; }
    if (!streamOn()) { teardown(); return false; }

    m_frame_id = 0;
    m_stop_requested.store(false);

    if (!m_task.Create("V4l2Capture", &V4l2Backend::TaskEntry, this)) {
        fail(Status::TASK_FAIL);
        teardown();
        return false;
    }

    m_running = true;
    std::cout << "[V4L2] STARTED dev=" << m_cfg.dev
              << " native=" << m_width << "x" << m_height
              << " out=" << m_out_width << "x" << m_out_height << "\n";
    return true;
}

void V4l2Backend::Stop() {
    if (m_running) {
        m_stop_requested.store(true);
        m_task.Join();
        m_running = false;
        std::cout << "[V4L2] STOPPED frames=" << m_frame_id << "\n";
    }
    teardown();
}

void V4l2Backend::teardown() {
    if (m_streaming) {
        streamOff();
        m_streaming = false;
    }
    unmapBuffers();
    closeDevice();
    m_on_frame = nullptr;
}

// Static task entry function compatible with OSAL (void (*)(void*)).
void V4l2Backend::TaskEntry(void* arg) {
    auto* self = static_cast<V4l2Backend*>(arg);
    if (!self) return;
    self->Run();
}

void V4l2Backend::Run() {
    while (!m_stop_requested.load()) {

        pollfd pfd{};
        pfd.fd = m_fd;
        pfd.events = POLLIN;

        const int r = ::poll(&pfd, 1, static_cast<int>(m_cfg.poll_timeout_ms));
        if (r == 0) continue;             // timeout: re-check stop flag
        if (r < 0) {
            if (errno == EINTR) continue;
            fail(Status::POLL_FAIL);
            std::cerr << "[V4L2] POLL_FAIL errno=" << m_errno << "\n";
            Rtos::SleepMs(static_cast<int>(m_cfg.poll_timeout_ms));
            continue;
        }

        if (!captureOne()) {
            // Device unplugged or driver error. Keep trying until stopped;
            // the sampler keeps serving the last good frame.
            std::cerr << "[V4L2] CAPTURE_FAIL status=" << StatusStr(m_status)
                      << " errno=" << m_errno << "\n";
            Rtos::SleepMs(static_cast<int>(m_cfg.poll_timeout_ms));
        }
    }
}

bool V4l2Backend::captureOne() {
    v4l2_buffer buf{};
    buf.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buf.memory = V4L2_MEMORY_MMAP;

    if (xioctl(m_fd, VIDIOC_DQBUF, &buf) == -1) {
        if (errno == EAGAIN) return true; // spurious wakeup
        return fail(Status::DQBUF_FAIL);
    }

    const uint32_t idx = buf.index;
    if (idx >= m_buf_count) {
        // Should never happen if driver is sane.
        return fail(Status::BAD_BUFF_INDEX);
    }

    msg::RgbFrame f{};
    const bool converted = ConvertBuffer(m_bufs[idx].ptr, m_width, m_height, m_stride, m_pixfmt,
                                         m_out_width, m_out_height, f);

    // Back to the driver before anything else; f owns its pixels.
    if (!requeue(idx)) return false;
    if (!converted) return fail(Status::UNSUPPORTED_FORMAT);

    f.t_capture_us = Rtos::MonoUs();
    f.frame_id     = m_frame_id++;

    m_on_frame(f);
    return true;
}

bool V4l2Backend::ConvertBuffer(const uint8_t* data, uint32_t width, uint32_t height,
                                uint32_t stride, uint32_t pixfmt,
                                uint32_t out_w, uint32_t out_h, msg::RgbFrame& out) {
    if (!data || width == 0 || height == 0 || out_w == 0 || out_h == 0) return false;

    const uint8_t bpp = bytes_per_px_from_pixfmt(pixfmt);
    if (bpp == 0) return false;
    if (stride == 0) stride = width * bpp;
    if (stride < width * bpp) return false;

    // Non-owning view over the driver buffer; every branch below writes a new Mat.
    uint8_t* src = const_cast<uint8_t*>(data);
    cv::Mat rgb;
    switch (pixfmt) {
        case V4L2_PIX_FMT_YUYV: {
            cv::Mat view(int(height), int(width), CV_8UC2, src, stride);
            cv::cvtColor(view, rgb, cv::COLOR_YUV2RGB_YUYV);
            break;
        }
        case V4L2_PIX_FMT_BGR24: {
            cv::Mat view(int(height), int(width), CV_8UC3, src, stride);
            cv::cvtColor(view, rgb, cv::COLOR_BGR2RGB);
            break;
        }
        default: { // RGB24
            cv::Mat view(int(height), int(width), CV_8UC3, src, stride);
            rgb = view.clone();
            break;
        }
    }

    if (width == out_w && height == out_h) {
        out.pixels = rgb;
    } else {
        cv::resize(rgb, out.pixels, cv::Size(int(out_w), int(out_h)), 0, 0, cv::INTER_AREA);
    }
    out.width  = out_w;
    out.height = out_h;
    return true;
}

bool V4l2Backend::requeue(uint32_t idx) {
    if (idx >= m_buf_count) return fail(Status::BAD_BUFF_INDEX);

    v4l2_buffer buf{};
    buf.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buf.memory = V4L2_MEMORY_MMAP;
    buf.index  = idx;

    if (xioctl(m_fd, VIDIOC_QBUF, &buf) == -1) {
        return fail(Status::QBUF_FAIL);
    }
    return true;
}

// -------------------- private helpers --------------------

bool V4l2Backend::openDevice() {
    m_fd = ::open(m_cfg.dev, O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (m_fd < 0) return fail(Status::OPEN_FAIL);
    return true;
}

bool V4l2Backend::queryCaps() {
    v4l2_capability cap{};
    if (xioctl(m_fd, VIDIOC_QUERYCAP, &cap) == -1) return fail(Status::QUERYCAP_FAIL);

    // Multi-function devices report per-node caps in device_caps.
    const uint32_t caps = (cap.capabilities & V4L2_CAP_DEVICE_CAPS) ? cap.device_caps
                                                                    : cap.capabilities;
    const bool streaming = (caps & V4L2_CAP_STREAMING) != 0;
    const bool capture   = (caps & V4L2_CAP_VIDEO_CAPTURE) != 0;

    if (!streaming || !capture){
        return fail(Status::UNSUPPORTED_CAPS);
    }
    return true;
}

bool V4l2Backend::setAndVerifyFormat() {
    if (bytes_per_px_from_pixfmt(m_cfg.v4l2_pixfmt) == 0) return fail(Status::UNSUPPORTED_FORMAT);

    v4l2_format fmt{};
    fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;

    fmt.fmt.pix.width       = m_cfg.width;
    fmt.fmt.pix.height      = m_cfg.height;
    fmt.fmt.pix.pixelformat = m_cfg.v4l2_pixfmt;
    fmt.fmt.pix.field       = V4L2_FIELD_NONE;

    if (xioctl(m_fd, VIDIOC_S_FMT, &fmt) == -1) return fail(Status::SETFMT_FAIL);
    if (xioctl(m_fd, VIDIOC_G_FMT, &fmt) == -1) return fail(Status::SETFMT_FAIL);

    // Size may be adjusted by the driver (we scale anyway); the pixel format may not.
    if (fmt.fmt.pix.pixelformat != m_cfg.v4l2_pixfmt) {
        errno = 0;
        return fail(Status::UNSUPPORTED_FORMAT);
    }

    m_width  = fmt.fmt.pix.width;
    m_height = fmt.fmt.pix.height;
    m_stride = fmt.fmt.pix.bytesperline;
    m_pixfmt = fmt.fmt.pix.pixelformat;

    if (m_width == 0 || m_height == 0) return fail(Status::SETFMT_FAIL);

    // Basic sanity: stride must fit at least one row
    const uint8_t bpp = bytes_per_px_from_pixfmt(m_pixfmt);
    if (m_stride == 0) m_stride = m_width * bpp;
    if (m_stride < (m_width * bpp)) return fail(Status::SETFMT_FAIL);

    return true;
}

bool V4l2Backend::requestAndMapBuffers() {

    v4l2_requestbuffers req{};
    req.count  = m_cfg.buffer_count;
    req.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    req.memory = V4L2_MEMORY_MMAP;

    if (xioctl(m_fd, VIDIOC_REQBUFS, &req) == -1) return fail(Status::REQBUFS_FAIL);
    if (req.count < 2 || req.count > V4L2_MAX_BUFS) return fail(Status::REQBUFS_FAIL);

    m_buf_count = req.count;

    for (uint32_t i = 0; i < m_buf_count; ++i) {
        v4l2_buffer buf{};
        buf.type   = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        buf.memory = V4L2_MEMORY_MMAP;
        buf.index  = i;

        if (xioctl(m_fd, VIDIOC_QUERYBUF, &buf) == -1) return fail(Status::QUERYBUF_FAIL);

        void* p = ::mmap(nullptr, buf.length, PROT_READ | PROT_WRITE, MAP_SHARED, m_fd, buf.m.offset);
        if (p == MAP_FAILED) return fail(Status::MMAP_FAIL);

        m_bufs[i].ptr = static_cast<uint8_t*>(p);
        m_bufs[i].len = buf.length;
    }

    return true;
}

bool V4l2Backend::queueAllBuffers() {
    for (uint32_t i = 0; i < m_buf_count; ++i) {
        if (!requeue(i)) return false;
    }
    return true;
}

bool V4l2Backend::streamOn() {
    int type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    if (xioctl(m_fd, VIDIOC_STREAMON, &type) == -1) return fail(Status::STREAMON_FAIL);
    m_streaming = true;
    return true;
}

void V4l2Backend::streamOff() {
    int type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    if (xioctl(m_fd, VIDIOC_STREAMOFF, &type) == -1) {
        // Shutdown path: report and carry on releasing.
        std::cerr << "[V4L2] STREAMOFF_FAIL errno=" << errno << "\n";
    }
}

void V4l2Backend::unmapBuffers() {
    for (uint32_t i = 0; i < m_buf_count; ++i) {
        if (m_bufs[i].ptr && m_bufs[i].len) {
            ::munmap(m_bufs[i].ptr, m_bufs[i].len);
        }
        m_bufs[i].ptr = nullptr;
        m_bufs[i].len = 0;
    }
    m_buf_count = 0;
}

void V4l2Backend::closeDevice() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

// FDIR

bool V4l2Backend::fail(Status s) {
    m_status = s;

    switch (s) {
        //syscall fails have an errno associated
        case Status::OPEN_FAIL:
        case Status::QUERYCAP_FAIL:
        case Status::SETFMT_FAIL:
        case Status::REQBUFS_FAIL:
        case Status::QUERYBUF_FAIL:
        case Status::MMAP_FAIL:
        case Status::QBUF_FAIL:
        case Status::STREAMON_FAIL:
        case Status::DQBUF_FAIL:
        case Status::POLL_FAIL:
            m_errno = errno;
            break;

        default:
            m_errno = 0;   // logic failure
            break;
    }
    return false;
}

const char* V4l2Backend::StatusStr(V4l2Backend::Status s) {
    switch (s) {
        case Status::OK:                 return "OK";
        case Status::OPEN_FAIL:          return "OPEN_FAIL";
        case Status::QUERYCAP_FAIL:      return "QUERYCAP_FAIL";
        case Status::SETFMT_FAIL:        return "SETFMT_FAIL";
        case Status::REQBUFS_FAIL:       return "REQBUFS_FAIL";
        case Status::QUERYBUF_FAIL:      return "QUERYBUF_FAIL";
        case Status::MMAP_FAIL:          return "MMAP_FAIL";
        case Status::QBUF_FAIL:          return "QBUF_FAIL";
        case Status::STREAMON_FAIL:      return "STREAMON_FAIL";
        case Status::DQBUF_FAIL:         return "DQBUF_FAIL";
        case Status::POLL_FAIL:          return "POLL_FAIL";
        case Status::ALREADY_RUNNING:    return "ALREADY_RUNNING";
        case Status::BAD_SIZE:           return "BAD_SIZE";
        case Status::BAD_BUFF_INDEX:     return "BAD_BUFF_INDEX";
        case Status::UNSUPPORTED_CAPS:   return "UNSUPPORTED_CAPS";
        case Status::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
        case Status::TASK_FAIL:          return "TASK_FAIL";
        default:                         return "UNKNOWN";
    }
}

} // namespace platform
