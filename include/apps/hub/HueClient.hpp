#pragma once
#include <cstdint>
#include <string>

#include "apps/hub/ILightClient.hpp"

namespace hub {

// ------------------------------
// Config
// ------------------------------
struct HueClientConfig {
    std::string host;            // bridge address (IP or name), no scheme
    uint16_t    port = 80;
    std::string app_key;         // whitelisted username / application key

    uint32_t connect_timeout_ms = 2000;
    uint32_t io_timeout_ms      = 2000;   // per send()/recv()

    uint32_t max_response_bytes = 64 * 1024;
};

// ------------------------------
// HueClient: one HTTP/1.1 request per command against the bridge's
// /api/<app_key>/lights/<id>/state resource. No pairing, no discovery;
// host and key come from configuration.
// ------------------------------
class HueClient : public ILightClient {
public:
    explicit HueClient(const HueClientConfig& cfg);

    bool SetLightColor(const std::string& light_id, const msg::ChromaXY& xy, bool on) override;
    const char* LastError() const override { return StatusStr(m_status); }

    // "host" or "host:port" -> parts. Returns false on an empty host or bad port.
    static bool ParseHost(const std::string& in, std::string& host, uint16_t& port);

    // {"on":<on>,"xy":[x,y]} with 4-decimal xy.
    static std::string BuildStateBody(const msg::ChromaXY& xy, bool on);

    enum class Status : uint8_t {
        OK = 0,
        BAD_CONFIG,
        RESOLVE_FAIL,
        CONNECT_FAIL,
        SEND_FAIL,
        RECV_FAIL,
        HTTP_ERROR,      // non-2xx status line
        BAD_RESPONSE,    // unparsable HTTP or JSON
        HUB_ERROR,       // bridge answered with an "error" element
    };

    static const char* StatusStr(Status s);

    Status lastStatus() const { return m_status; }
    int    lastErrno()  const { return m_errno; }
    int    lastHttpStatus() const { return m_http_status; }
    const std::string& lastHubError() const { return m_hub_error; }

private:
    // Full request/response exchange. Fills m_http_status and body.
    bool request(const char* method, const std::string& path,
                 const std::string& body, std::string& resp_body);

    int  connectSocket();
    bool checkHubReply(const std::string& resp_body);

    bool fail(Status s);

    HueClientConfig m_cfg{};

    // FDIR
    Status m_status = Status::OK;
    int    m_errno  = 0;
    int    m_http_status = 0;
    std::string m_hub_error;
};

} // namespace hub
