// ScreenSync.cpp
#include "apps/screen/ScreenSync.hpp"
#include "apps/color/ColorConverter.hpp"
#include "os/rtos.hpp"

#include <iomanip>
#include <iostream>

namespace screen {

static inline ScreenSyncConfig sanitise(const ScreenSyncConfig& in) {
    ScreenSyncConfig cfg = in;
    if (cfg.period_ms < 10) cfg.period_ms = 10;
    if (cfg.period_ms > 60000) cfg.period_ms = 60000;
    return cfg;
}

ScreenSync::ScreenSync(const FrameSampler& sampler, hub::ILightClient& light, const ScreenSyncConfig& cfg)
: m_sampler(sampler)
, m_light(light)
, m_cfg(sanitise(cfg)) {
}

ScreenSync::Status ScreenSync::Run(uint64_t max_iterations) {
    if (!m_sampler.running() || m_cfg.light_id.empty()) {
        std::cerr << "[SYNC] NOT_READY sampler_running=" << m_sampler.running()
                  << " light=\"" << m_cfg.light_id << "\"\n";
        return Status::NOT_READY;
    }

    std::cout << "[SYNC] START light=" << m_cfg.light_id
              << " region=(" << m_cfg.region.left << "," << m_cfg.region.top << ","
              << m_cfg.region.right << "," << m_cfg.region.bottom << ")"
              << " period_ms=" << m_cfg.period_ms << "\n";

    const uint64_t period_us = uint64_t(m_cfg.period_ms) * 1000ull;

    while (!StopRequested()) {
        const uint64_t t0 = Rtos::MonoUs();

        if (!step()) {
            std::cerr << "[SYNC] HUB_FAIL consecutive=" << m_consecutive_failures
                      << " error=" << m_light.LastError() << "\n";
            return Status::HUB_FAIL;
        }

        if (max_iterations != 0 && m_iterations >= max_iterations) break;
        if (StopRequested()) break;

        // Sleep the remainder of the period (a signal cuts it short).
        const uint64_t dt = Rtos::MonoUs() - t0;
        if (dt < period_us) {
            Rtos::SleepMs(static_cast<int>((period_us - dt) / 1000ull));
        }
    }

    std::cout << "[SYNC] STOP iterations=" << m_iterations
              << " failed=" << m_sends_failed << "\n";
    return Status::OK;
}

// One cycle. Returns false once the failure budget is spent.
bool ScreenSync::step() {
    const msg::Rgb8 rgb = m_sampler.GetRegionColor(m_cfg.region);
    const msg::ChromaXY xy = color::RgbToXy(rgb);

    ++m_iterations;
    m_last_rgb = rgb;

    if (m_cfg.verbose) {
        std::cout << "[SYNC] rgb=(" << int(rgb.r) << "," << int(rgb.g) << "," << int(rgb.b) << ")"
                  << std::fixed << std::setprecision(4)
                  << " xy=(" << xy.x << "," << xy.y << ")\n"
                  << std::defaultfloat << std::setprecision(6);
    }

    if (m_light.SetLightColor(m_cfg.light_id, xy, /*on=*/true)) {
        if (m_consecutive_failures > 0) {
            std::cout << "[SYNC] RECOVERED after=" << m_consecutive_failures << "\n";
        }
        m_consecutive_failures = 0;
        return true;
    }

    ++m_sends_failed;
    ++m_consecutive_failures;
    if (m_consecutive_failures == 1) {
        std::cerr << "[SYNC] SEND_FAIL error=" << m_light.LastError() << "\n";
    }

    return m_cfg.max_consecutive_failures == 0
        || m_consecutive_failures < m_cfg.max_consecutive_failures;
}

const char* ScreenSync::StatusStr(Status s) {
    switch (s) {
        case Status::OK:        return "OK";
        case Status::NOT_READY: return "NOT_READY";
        case Status::HUB_FAIL:  return "HUB_FAIL";
        default:                return "UNKNOWN";
    }
}

} // namespace screen
