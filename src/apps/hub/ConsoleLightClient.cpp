#include "apps/hub/ConsoleLightClient.hpp"

#include <iomanip>

namespace hub {

bool ConsoleLightClient::SetLightColor(const std::string& light_id, const msg::ChromaXY& xy, bool on) {
    const std::ios::fmtflags flags = m_out.flags();
    const std::streamsize prec = m_out.precision();

    m_out << "[DRYRUN] SET light=" << light_id
          << std::fixed << std::setprecision(4)
          << " xy=(" << xy.x << "," << xy.y << ")"
          << " on=" << (on ? 1 : 0) << "\n";

    m_out.flags(flags);
    m_out.precision(prec);
    ++m_calls;
    return true;
}

} // namespace hub
