// ScreenCastBackend.cpp
#include "platform/linux/ScreenCastBackend.hpp"

#include <iostream>
#include <sstream>

#include <opencv2/imgproc.hpp>

namespace platform {

static inline ScreenCastConfig sanitise(const ScreenCastConfig& in) {
    ScreenCastConfig cfg = in;
    if (cfg.source.empty()) cfg.source = ScreenCastConfig{}.source;

    // Without keepalive-time a static screen produces no buffers, read()
    // never returns and Stop() cannot join the capture task.
    static const std::string PW = "pipewiresrc";
    if (cfg.source.compare(0, PW.size(), PW) == 0 &&
        cfg.source.find("keepalive-time") == std::string::npos) {
        cfg.source.insert(PW.size(), " keepalive-time=1000");
    }
    if (cfg.max_empty_reads == 0) cfg.max_empty_reads = 1;
    return cfg;
}

ScreenCastBackend::ScreenCastBackend(const ScreenCastConfig& cfg)
: m_cfg(sanitise(cfg)) {
}

ScreenCastBackend::~ScreenCastBackend() {
    Stop();
}

std::string ScreenCastBackend::PipelineString(uint32_t width, uint32_t height) const {
    // videoconvert twice: once so videoscale gets a format it handles, once
    // to land on BGR (the layout OpenCV's appsink reader expects).
    std::ostringstream os;
    os << m_cfg.source
       << " ! videoconvert ! videoscale ! videoconvert"
       << " ! video/x-raw,format=BGR,width=" << width << ",height=" << height
       << " ! appsink max-buffers=1 drop=true sync=false";
    return os.str();
}

bool ScreenCastBackend::Start(uint32_t width, uint32_t height, FrameCallback on_frame) {
    if (m_running) return fail(Status::ALREADY_RUNNING);

    // Reseting any previous errors
    m_status = Status::OK;

    if (width == 0 || height == 0 || !on_frame) return fail(Status::BAD_SIZE);

    m_width    = width;
    m_height   = height;
    m_on_frame = std::move(on_frame);
    m_frame_id = 0;
    m_stop_requested.store(false);

    const std::string pipeline = PipelineString(width, height);
    std::cout << "[SCREEN] OPEN pipeline=\"" << pipeline << "\"\n";

    // Blocks through the portal handshake; returns false if PLAYING fails.
    if (!m_cap.open(pipeline, cv::CAP_GSTREAMER)) {
        m_cap.release();
        return fail(Status::OPEN_FAIL);
    }

    if (!m_task.Create("ScreenCapture", &ScreenCastBackend::TaskEntry, this)) {
        m_cap.release();
        return fail(Status::TASK_FAIL);
    }

    m_running = true;
    return true;
}

void ScreenCastBackend::Stop() {
    if (!m_running) return;

    m_stop_requested.store(true);
    m_task.Join();

    // Sets the pipeline to NULL and frees it.
    m_cap.release();

    m_on_frame = nullptr;
    m_running  = false;
    std::cout << "[SCREEN] STOPPED frames=" << m_frame_id << "\n";
}

void ScreenCastBackend::TaskEntry(void* arg) {
    auto* self = static_cast<ScreenCastBackend*>(arg);
    if (!self) return;
    self->Run();
}

void ScreenCastBackend::Run() {
    cv::Mat bgr;
    uint32_t empty_reads = 0;
    bool lost_reported = false;

    while (!m_stop_requested.load()) {

        if (!m_cap.read(bgr) || bgr.empty()) {
            if (++empty_reads >= m_cfg.max_empty_reads && !lost_reported) {
                std::cerr << "[SCREEN] NO_SIGNAL empty_reads=" << empty_reads << "\n";
                lost_reported = true;
            }
            Rtos::SleepMs(10);
            continue;
        }
        empty_reads = 0;
        lost_reported = false;

        // Fresh Mat per frame: published frames must never alias `bgr`.
        msg::RgbFrame f{};
        cv::cvtColor(bgr, f.pixels, cv::COLOR_BGR2RGB);

        if (static_cast<uint32_t>(f.pixels.cols) != m_width ||
            static_cast<uint32_t>(f.pixels.rows) != m_height) {
            cv::Mat scaled;
            cv::resize(f.pixels, scaled, cv::Size(int(m_width), int(m_height)), 0, 0, cv::INTER_AREA);
            f.pixels = scaled;
        }

        f.width        = m_width;
        f.height       = m_height;
        f.t_capture_us = Rtos::MonoUs();
        f.frame_id     = m_frame_id++;

        m_on_frame(f);
    }
}

// FDIR

bool ScreenCastBackend::fail(Status s) {
    m_status = s;
    return false;
}

const char* ScreenCastBackend::StatusStr(Status s) {
    switch (s) {
        case Status::OK:              return "OK";
        case Status::ALREADY_RUNNING: return "ALREADY_RUNNING";
        case Status::BAD_SIZE:        return "BAD_SIZE";
        case Status::OPEN_FAIL:       return "OPEN_FAIL";
        case Status::TASK_FAIL:       return "TASK_FAIL";
        default:                      return "UNKNOWN";
    }
}

} // namespace platform
