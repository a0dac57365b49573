// HueClient.cpp
#include "apps/hub/HueClient.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>

// POSIX sockets (Linux)
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <json/json.h>

namespace {

static bool send_all(int fd, const char* data, size_t n) {
    while (n > 0) {
        ssize_t w = ::send(fd, data, n, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        data += (size_t)w;
        n -= (size_t)w;
    }
    return true;
}

static void set_io_timeout(int fd, uint32_t timeout_ms) {
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(timeout_ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Non-blocking connect bounded by timeout_ms. Leaves fd blocking on success.
static bool connect_with_timeout(int fd, const sockaddr* addr, socklen_t len, uint32_t timeout_ms) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;

    int rc = ::connect(fd, addr, len);
    if (rc < 0 && errno == EINPROGRESS) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        do { rc = ::poll(&pfd, 1, static_cast<int>(timeout_ms)); }
        while (rc < 0 && errno == EINTR);
        if (rc == 0) { errno = ETIMEDOUT; return false; }
        if (rc < 0) return false;

        int so_err = 0;
        socklen_t so_len = sizeof(so_err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &so_len) < 0) return false;
        if (so_err != 0) { errno = so_err; return false; }
        rc = 0;
    }
    if (rc < 0) return false;

    return ::fcntl(fd, F_SETFL, flags) == 0;
}

// Decode a chunked transfer-encoded body. Returns false if malformed.
static bool dechunk(const std::string& in, std::string& out) {
    out.clear();
    size_t pos = 0;
    while (true) {
        const size_t eol = in.find("\r\n", pos);
        if (eol == std::string::npos) return false;
        const std::string size_hex = in.substr(pos, eol - pos);
        char* end = nullptr;
        const unsigned long n = std::strtoul(size_hex.c_str(), &end, 16);
        if (end == size_hex.c_str()) return false;
        pos = eol + 2;
        if (n == 0) return true;
        if (pos + n > in.size()) return false;
        out.append(in, pos, n);
        pos += n + 2; // skip CRLF after chunk data
    }
}

// Light ids go into the request path verbatim: [A-Za-z0-9_-]+ only.
static bool valid_light_id(const std::string& id) {
    if (id.empty()) return false;
    for (const char c : id) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // anonymous namespace

namespace hub {

static inline HueClientConfig sanitise(const HueClientConfig& in) {
    HueClientConfig cfg = in;

    if (cfg.port == 0) cfg.port = 80;
    if (cfg.connect_timeout_ms == 0) cfg.connect_timeout_ms = 2000;
    if (cfg.io_timeout_ms == 0) cfg.io_timeout_ms = 2000;
    if (cfg.max_response_bytes < 1024) cfg.max_response_bytes = 1024;

    return cfg;
}

HueClient::HueClient(const HueClientConfig& cfg)
: m_cfg(sanitise(cfg)) {
}

bool HueClient::ParseHost(const std::string& in, std::string& host, uint16_t& port) {
    const size_t colon = in.rfind(':');
    if (colon == std::string::npos) {
        if (in.empty()) return false;
        host = in;
        return true;
    }

    const std::string h = in.substr(0, colon);
    const std::string p = in.substr(colon + 1);
    if (h.empty() || p.empty()) return false;

    char* end = nullptr;
    const long v = std::strtol(p.c_str(), &end, 10);
    if (*end != '\0' || v <= 0 || v > 65535) return false;

    host = h;
    port = static_cast<uint16_t>(v);
    return true;
}

std::string HueClient::BuildStateBody(const msg::ChromaXY& xy, bool on) {
    Json::Value root(Json::objectValue);
    root["on"] = on;
    Json::Value arr(Json::arrayValue);
    arr.append(xy.x);
    arr.append(xy.y);
    root["xy"] = arr;

    Json::StreamWriterBuilder wb;
    wb["indentation"] = "";
    wb["precision"] = 4;
    wb["precisionType"] = "decimal";
    return Json::writeString(wb, root);
}

bool HueClient::SetLightColor(const std::string& light_id, const msg::ChromaXY& xy, bool on) {
    // Reseting any previous errors
    m_status = Status::OK;
    m_errno = 0;
    m_http_status = 0;
    m_hub_error.clear();

    if (m_cfg.host.empty() || m_cfg.app_key.empty() || !valid_light_id(light_id)) {
        return fail(Status::BAD_CONFIG);
    }

    const std::string path = "/api/" + m_cfg.app_key + "/lights/" + light_id + "/state";

    std::string resp;
    if (!request("PUT", path, BuildStateBody(xy, on), resp)) return false;

    return checkHubReply(resp);
}

// Bridge replies with a JSON array of {"success":{...}} / {"error":{...}}.
bool HueClient::checkHubReply(const std::string& resp_body) {
    Json::CharReaderBuilder rb;
    std::unique_ptr<Json::CharReader> reader(rb.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(resp_body.data(), resp_body.data() + resp_body.size(), &root, &errs)) {
        return fail(Status::BAD_RESPONSE);
    }
    if (!root.isArray()) return fail(Status::BAD_RESPONSE);

    for (const auto& item : root) {
        if (item.isObject() && item.isMember("error")) {
            m_hub_error = item["error"].get("description", "unknown error").asString();
            return fail(Status::HUB_ERROR);
        }
    }
    return true;
}

int HueClient::connectSocket() {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string port = std::to_string(m_cfg.port);
    if (::getaddrinfo(m_cfg.host.c_str(), port.c_str(), &hints, &res) != 0 || !res) {
        fail(Status::RESOLVE_FAIL);
        return -1;
    }

    int fd = -1;
    int last_errno = 0;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) { last_errno = errno; continue; }

        if (connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, m_cfg.connect_timeout_ms)) break;

        last_errno = errno;
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        errno = last_errno;
        fail(Status::CONNECT_FAIL);
        return -1;
    }

    set_io_timeout(fd, m_cfg.io_timeout_ms);
    return fd;
}

bool HueClient::request(const char* method, const std::string& path,
                        const std::string& body, std::string& resp_body) {
    const int fd = connectSocket();
    if (fd < 0) return false;

    std::ostringstream req;
    req << method << " " << path << " HTTP/1.1\r\n"
        << "Host: " << m_cfg.host << "\r\n"
        << "Content-Type: application/json\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    const std::string wire = req.str();

    if (!send_all(fd, wire.data(), wire.size())) {
        fail(Status::SEND_FAIL);
        ::close(fd);
        return false;
    }

    // Read until the peer closes (Connection: close).
    std::string raw;
    char buf[2048];
    while (true) {
        const ssize_t r = ::recv(fd, buf, sizeof(buf), 0);
        if (r < 0 && errno == EINTR) continue;
        if (r < 0) {
            fail(Status::RECV_FAIL);
            ::close(fd);
            return false;
        }
        if (r == 0) break;
        raw.append(buf, static_cast<size_t>(r));
        if (raw.size() > m_cfg.max_response_bytes) {
            ::close(fd);
            return fail(Status::BAD_RESPONSE);
        }
    }
    ::close(fd);

    // ---- status line ----
    const size_t hdr_end = raw.find("\r\n\r\n");
    if (raw.compare(0, 5, "HTTP/") != 0 || hdr_end == std::string::npos) {
        return fail(Status::BAD_RESPONSE);
    }
    const size_t sp = raw.find(' ');
    if (sp == std::string::npos || sp > hdr_end) return fail(Status::BAD_RESPONSE);
    m_http_status = std::atoi(raw.c_str() + sp + 1);

    if (m_http_status < 200 || m_http_status >= 300) {
        return fail(Status::HTTP_ERROR);
    }

    // ---- body ----
    const std::string headers = lower(raw.substr(0, hdr_end));
    const std::string payload = raw.substr(hdr_end + 4);
    if (headers.find("transfer-encoding: chunked") != std::string::npos) {
        if (!dechunk(payload, resp_body)) return fail(Status::BAD_RESPONSE);
    } else {
        resp_body = payload;
    }
    return true;
}

// FDIR

bool HueClient::fail(Status s) {
    m_status = s;

    switch (s) {
        // socket fails have an errno associated
        case Status::CONNECT_FAIL:
        case Status::SEND_FAIL:
        case Status::RECV_FAIL:
            m_errno = errno;
            break;

        default:
            m_errno = 0;
            break;
    }
    return false;
}

const char* HueClient::StatusStr(Status s) {
    switch (s) {
        case Status::OK:           return "OK";
        case Status::BAD_CONFIG:   return "BAD_CONFIG";
        case Status::RESOLVE_FAIL: return "RESOLVE_FAIL";
        case Status::CONNECT_FAIL: return "CONNECT_FAIL";
        case Status::SEND_FAIL:    return "SEND_FAIL";
        case Status::RECV_FAIL:    return "RECV_FAIL";
        case Status::HTTP_ERROR:   return "HTTP_ERROR";
        case Status::BAD_RESPONSE: return "BAD_RESPONSE";
        case Status::HUB_ERROR:    return "HUB_ERROR";
        default:                   return "UNKNOWN";
    }
}

} // namespace hub
