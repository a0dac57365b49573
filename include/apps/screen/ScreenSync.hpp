#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include "apps/screen/FrameSampler.hpp"
#include "apps/hub/ILightClient.hpp"
#include "msg/Color.hpp"

namespace screen {

struct ScreenSyncConfig {
    std::string light_id;
    msg::Region region{};

    // ~10 Hz keeps well under the bridge's command rate limit.
    uint32_t period_ms = 100;

    // Give up after this many failed SetLightColor calls in a row. 0 = never.
    uint32_t max_consecutive_failures = 5;

    // Log every dispatched color.
    bool verbose = false;
};

// ---------------------------------------------------------------------------
//  ScreenSync: region color -> xy -> SetLightColor, once per period, until
//  RequestStop(). Runs on the caller's thread. Does not own the sampler or
//  the client; closing the sampler stays with whoever started it.
// ---------------------------------------------------------------------------
class ScreenSync {
public:
    ScreenSync(const FrameSampler& sampler, hub::ILightClient& light, const ScreenSyncConfig& cfg);

    enum class Status : uint8_t {
        OK = 0,          // stopped on request or iteration limit
        NOT_READY,       // sampler not running / no light id
        HUB_FAIL,        // too many consecutive SetLightColor failures
    };

    // max_iterations == 0 runs until RequestStop().
    Status Run(uint64_t max_iterations = 0);

    // Thread-safe; only touches a lock-free atomic, so it may be called from
    // a signal handler.
    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    static const char* StatusStr(Status s);

    uint64_t Iterations() const { return m_iterations; }
    uint64_t SendsFailed() const { return m_sends_failed; }
    msg::Rgb8 LastColor() const { return m_last_rgb; }

private:
    bool step();

    const FrameSampler& m_sampler;
    hub::ILightClient&  m_light;
    ScreenSyncConfig    m_cfg{};

    std::atomic<bool> m_stop_requested{false};

    uint64_t  m_iterations = 0;
    uint64_t  m_sends_failed = 0;
    uint32_t  m_consecutive_failures = 0;
    msg::Rgb8 m_last_rgb{};
};

} // namespace screen
