#pragma once
#include <cstdint>
#include <functional>

#include "msg/RgbFrame.hpp"

namespace platform {

// A live frame source that pushes RGB frames scaled to a target resolution.
//
// Start() brings the source up and begins delivery on the backend's own
// thread; on_frame is invoked once per decoded frame from that thread and
// must not block for long. Start() either succeeds fully or leaves nothing
// running.
//
// Stop() ends delivery: once it returns, on_frame is never invoked again.
// Stop() is idempotent and safe after a failed Start().
class ICaptureBackend {
public:
    using FrameCallback = std::function<void(const msg::RgbFrame&)>;

    virtual ~ICaptureBackend() = default;

    virtual bool Start(uint32_t width, uint32_t height, FrameCallback on_frame) = 0;
    virtual void Stop() = 0;

    // Short name for logs ("screen", "v4l2", ...).
    virtual const char* Name() const = 0;

    // Human-readable cause of the last failure ("OK" if none).
    virtual const char* LastError() const = 0;
    virtual int LastErrno() const { return 0; }
};

} // namespace platform
