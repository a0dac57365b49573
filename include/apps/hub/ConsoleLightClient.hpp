#pragma once
#include <cstdint>
#include <ostream>
#include <string>

#include "apps/hub/ILightClient.hpp"

namespace hub {

// Dry-run client: logs each command instead of talking to a hub.
class ConsoleLightClient : public ILightClient {
public:
    explicit ConsoleLightClient(std::ostream& out) : m_out(out) {}

    bool SetLightColor(const std::string& light_id, const msg::ChromaXY& xy, bool on) override;
    const char* LastError() const override { return "OK"; }

    uint64_t Calls() const { return m_calls; }

private:
    std::ostream& m_out;
    uint64_t m_calls = 0;
};

} // namespace hub
