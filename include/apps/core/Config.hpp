#pragma once
#include <cstdint>
#include <string>

#include "msg/Color.hpp"

namespace hueru {

// ------------------------------
// Settings (defaults = behaviour with no config file)
// ------------------------------
struct CaptureSettings {
    std::string source = "screen";       // "screen" | "v4l2"
    std::string device = "/dev/video0";  // v4l2 only
    // screen only; GStreamer source element(s), empty = PipeWire portal.
    // The source must keep producing buffers on a static screen or stopping
    // blocks; pipewiresrc gets keepalive-time=1000 added when it has none.
    std::string pipeline_source;
    uint32_t width  = 160;
    uint32_t height = 90;
};

struct SyncSettings {
    uint32_t period_ms = 100;
    msg::Region region{};
    uint32_t max_failures = 5;
};

struct AppConfig {
    // Hub session. Required by hub commands only.
    std::string host;       // "ip" or "ip:port"
    std::string app_key;

    CaptureSettings capture;
    SyncSettings sync;

    bool hasHub() const { return !host.empty() && !app_key.empty(); }
};

// ------------------------------
// ConfigStore: JSON file persistence (.hueru.json by default).
//
// {
//   "host": "192.168.1.2", "app_key": "...",
//   "capture": { "source": "screen", "device": "/dev/video0",
//                "pipeline_source": "...", "width": 160, "height": 90 },
//   "sync": { "period_ms": 100, "region": [0, 0, 1, 1], "max_failures": 5 }
// }
//
// Unknown keys are kept across Load()/Save().
// ------------------------------
class ConfigStore {
public:
    static constexpr const char* DEFAULT_PATH = ".hueru.json";

    explicit ConfigStore(std::string path = DEFAULT_PATH);

    // Missing file: returns false with NOT_FOUND and leaves `out` at defaults.
    bool Load(AppConfig& out);

    // Writes atomically (temp file + rename).
    bool Save(const AppConfig& cfg);

    const std::string& path() const { return m_path; }

    enum class Status : uint8_t {
        OK = 0,
        NOT_FOUND,
        READ_FAIL,
        PARSE_FAIL,
        BAD_VALUE,
        WRITE_FAIL,
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    // Parser message or the offending key.
    const std::string& lastDetail() const { return m_detail; }

private:
    bool fail(Status s, const std::string& detail);

    std::string m_path;

    // FDIR
    Status m_status = Status::OK;
    std::string m_detail;
};

// "l,t,r,b" -> Region. Each value must be a number in [0,1].
bool ParseRegion(const std::string& text, msg::Region& out);

} // namespace hueru
