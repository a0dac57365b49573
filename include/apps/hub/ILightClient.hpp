#pragma once
#include <string>

#include "msg/Color.hpp"

namespace hub {

// The only thing the sync loop needs from a lighting hub.
class ILightClient {
public:
    virtual ~ILightClient() = default;

    // Set one light's chromaticity and on/off state.
    // Returns false on failure; LastError() names the cause.
    virtual bool SetLightColor(const std::string& light_id, const msg::ChromaXY& xy, bool on) = 0;

    virtual const char* LastError() const = 0;
};

} // namespace hub
