// FrameSampler.cpp
#include "apps/screen/FrameSampler.hpp"

#include <cmath>
#include <iostream>
#include <mutex>

#include <opencv2/core.hpp>

namespace {

// Fraction -> pixel index: floor(f * dim), clamped to [0, dim].
// Non-finite fractions map to -1 so the caller sees an empty span.
static int to_pixel(double frac, int dim) {
    if (!std::isfinite(frac)) return -1;
    const double v = std::floor(frac * dim);
    if (v <= 0.0) return 0;
    if (v >= dim) return dim;
    return static_cast<int>(v);
}

static uint8_t to_channel(double mean) {
    if (!(mean > 0.0)) return 0;
    if (mean >= 255.0) return 255;
    return static_cast<uint8_t>(mean); // truncate, not round
}

} // anonymous namespace

namespace screen {

static inline FrameSamplerConfig sanitise(const FrameSamplerConfig& in) {
    FrameSamplerConfig cfg = in;

    if (cfg.width == 0)  cfg.width  = 160;
    if (cfg.height == 0) cfg.height = 90;

    if (cfg.recv_timeout_ms < 1) cfg.recv_timeout_ms = 1;
    if (cfg.recv_timeout_ms > 1000) cfg.recv_timeout_ms = 1000;

    return cfg;
}

FrameSampler::FrameSampler(platform::ICaptureBackend& backend, const FrameSamplerConfig& cfg)
: m_backend(backend)
, m_cfg(sanitise(cfg)) {
}

FrameSampler::~FrameSampler() {
    Close();
}

bool FrameSampler::Start() {
    if (m_running) return fail(Status::ALREADY_RUNNING);

    // Reseting any previous errors
    m_status = Status::OK;
    m_stop_requested.store(false);

    // Acquisition task first so no pushed frame waits on an idle consumer.
    if (!m_task.Create("FrameSampler", &FrameSampler::TaskEntry, this)) {
        return fail(Status::TASK_FAIL);
    }

    const bool ok = m_backend.Start(m_cfg.width, m_cfg.height,
                                    [this](const msg::RgbFrame& f) { onFrame(f); });
    if (!ok) {
        std::cerr << "[SAMPLER] START_FAIL backend=" << m_backend.Name()
                  << " status=" << m_backend.LastError()
                  << " errno=" << m_backend.LastErrno() << "\n";
        // No zombie state: the task we already started goes down too.
        stopTask();
        return fail(Status::CAPTURE_INIT_FAIL);
    }

    m_backend_running = true;
    m_running = true;
    std::cout << "[SAMPLER] STARTED backend=" << m_backend.Name()
              << " size=" << m_cfg.width << "x" << m_cfg.height << "\n";
    return true;
}

void FrameSampler::Close() {
    if (!m_running) return;

    // 1) Stop the pipeline: no more onFrame() calls after this returns.
    if (m_backend_running) {
        m_backend.Stop();
        m_backend_running = false;
    }

    // 2) Stop the acquisition loop.
    stopTask();

    {
        std::lock_guard<Rtos::Mutex> lk(m_latest_lock);
        m_latest.reset();
    }

    m_running = false;
    std::cout << "[SAMPLER] CLOSED received=" << m_frames_received.load()
              << " overwritten=" << m_frames_overwritten.load()
              << " rejected=" << m_frames_rejected.load() << "\n";
}

void FrameSampler::stopTask() {
    m_stop_requested.store(true);
    m_task.Join();

    // Leftover frame (if any) is stale now.
    msg::RgbFrame leftover{};
    while (m_live_q.try_receive(leftover)) {}
}

msg::Rgb8 FrameSampler::GetRegionColor(double left, double top, double right, double bottom) const {
    msg::Region region;
    region.left   = left;
    region.top    = top;
    region.right  = right;
    region.bottom = bottom;
    return GetRegionColor(region);
}

msg::Rgb8 FrameSampler::GetRegionColor(const msg::Region& region) const {
    const std::shared_ptr<const msg::RgbFrame> frame = Snapshot();
    if (!frame) return msg::Rgb8{};
    return RegionMean(*frame, region);
}

std::shared_ptr<const msg::RgbFrame> FrameSampler::Snapshot() const {
    std::lock_guard<Rtos::Mutex> lk(m_latest_lock);
    return m_latest;
}

msg::Rgb8 FrameSampler::RegionMean(const msg::RgbFrame& frame, const msg::Region& region) {
    if (frame.pixels.empty() || frame.pixels.type() != CV_8UC3) return msg::Rgb8{};

    const int w = frame.pixels.cols;
    const int h = frame.pixels.rows;

    const int x1 = to_pixel(region.left,   w);
    const int x2 = to_pixel(region.right,  w);
    const int y1 = to_pixel(region.top,    h);
    const int y2 = to_pixel(region.bottom, h);

    if (x1 < 0 || x2 < 0 || y1 < 0 || y2 < 0) return msg::Rgb8{};
    if (x2 <= x1 || y2 <= y1) return msg::Rgb8{};   // empty slice, no division

    // sum / count with a true division: cv::mean multiplies by 1/count,
    // which can land just under an exact integer and truncate one too low.
    const cv::Mat roi = frame.pixels(cv::Rect(x1, y1, x2 - x1, y2 - y1));
    const cv::Scalar s = cv::sum(roi);
    const double n = static_cast<double>(roi.total());

    msg::Rgb8 out;
    out.r = to_channel(s[0] / n);
    out.g = to_channel(s[1] / n);
    out.b = to_channel(s[2] / n);
    return out;
}

// -------------------- backend thread --------------------

void FrameSampler::onFrame(const msg::RgbFrame& f) {
    if (!f.consistent() || f.width != m_cfg.width || f.height != m_cfg.height) {
        if (m_frames_rejected.fetch_add(1) == 0) {
            std::cerr << "[SAMPLER] FRAME_REJECTED size=" << f.pixels.cols << "x" << f.pixels.rows
                      << " expected=" << m_cfg.width << "x" << m_cfg.height << "\n";
        }
        return;
    }

    // Depth-1 overwrite queue: an unconsumed older frame is discarded.
    (void)m_live_q.send(f);
    if (m_live_q.wasLastSendOverwritten()) {
        m_frames_overwritten.fetch_add(1);
    }
}

// -------------------- acquisition task --------------------

void FrameSampler::TaskEntry(void* arg) {
    auto* self = static_cast<FrameSampler*>(arg);
    if (!self) return;
    self->Run();
}

void FrameSampler::Run() {
    while (!m_stop_requested.load()) {
        msg::RgbFrame f{};
        if (!m_live_q.receive(f, m_cfg.recv_timeout_ms)) {
            continue;
        }
        publish(f);
    }
}

void FrameSampler::publish(const msg::RgbFrame& f) {
    auto next = std::make_shared<const msg::RgbFrame>(f);
    {
        std::lock_guard<Rtos::Mutex> lk(m_latest_lock);
        m_latest.swap(next);
    }
    // Old frame (now in `next`) is released outside the lock.
    m_frames_received.fetch_add(1);
}

// FDIR

bool FrameSampler::fail(Status s) {
    m_status = s;
    return false;
}

const char* FrameSampler::StatusStr(Status s) {
    switch (s) {
        case Status::OK:                return "OK";
        case Status::ALREADY_RUNNING:   return "ALREADY_RUNNING";
        case Status::TASK_FAIL:         return "TASK_FAIL";
        case Status::CAPTURE_INIT_FAIL: return "CAPTURE_INIT_FAIL";
        default:                        return "UNKNOWN";
    }
}

} // namespace screen
