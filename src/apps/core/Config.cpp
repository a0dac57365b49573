// Config.cpp
#include "apps/core/Config.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <utility>

#include <json/json.h>

namespace fs = std::filesystem;

namespace {

static bool in_unit(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

// Reads the raw document; missing file is not an error here (empty object).
static bool read_document(const std::string& path, Json::Value& root, std::string& errs, bool& found) {
    found = false;
    root = Json::Value(Json::objectValue);

    std::error_code ec;
    if (!fs::exists(path, ec)) return true;
    found = true;

    std::ifstream ifs(path);
    if (!ifs) {
        errs = "cannot open";
        return false;
    }

    Json::CharReaderBuilder rb;
    rb["collectComments"] = false;
    return Json::parseFromStream(rb, ifs, &root, &errs);
}

static bool get_uint(const Json::Value& obj, const char* key, uint32_t& out) {
    if (!obj.isMember(key)) return true;
    const Json::Value& v = obj[key];
    if (!v.isUInt()) return false;
    out = v.asUInt();
    return true;
}

static bool get_string(const Json::Value& obj, const char* key, std::string& out) {
    if (!obj.isMember(key)) return true;
    const Json::Value& v = obj[key];
    if (!v.isString()) return false;
    out = v.asString();
    return true;
}

} // anonymous namespace

namespace hueru {

ConfigStore::ConfigStore(std::string path)
: m_path(std::move(path)) {
    if (m_path.empty()) m_path = DEFAULT_PATH;
}

bool ConfigStore::Load(AppConfig& out) {
    // Reseting any previous errors
    m_status = Status::OK;
    m_detail.clear();

    out = AppConfig{};

    Json::Value root;
    std::string errs;
    bool found = false;
    if (!read_document(m_path, root, errs, found)) {
        return fail(errs == "cannot open" ? Status::READ_FAIL : Status::PARSE_FAIL, errs);
    }
    if (!found) return fail(Status::NOT_FOUND, m_path);
    if (!root.isObject()) return fail(Status::PARSE_FAIL, "top level is not an object");

    AppConfig cfg{};

    if (!get_string(root, "host", cfg.host))       return fail(Status::BAD_VALUE, "host");
    if (!get_string(root, "app_key", cfg.app_key)) return fail(Status::BAD_VALUE, "app_key");

    if (root.isMember("capture")) {
        const Json::Value& cap = root["capture"];
        if (!cap.isObject()) return fail(Status::BAD_VALUE, "capture");

        if (!get_string(cap, "source", cfg.capture.source)) return fail(Status::BAD_VALUE, "capture.source");
        if (cfg.capture.source != "screen" && cfg.capture.source != "v4l2") {
            return fail(Status::BAD_VALUE, "capture.source");
        }
        if (!get_string(cap, "device", cfg.capture.device)) return fail(Status::BAD_VALUE, "capture.device");
        if (!get_string(cap, "pipeline_source", cfg.capture.pipeline_source)) {
            return fail(Status::BAD_VALUE, "capture.pipeline_source");
        }
        if (!get_uint(cap, "width", cfg.capture.width) || cfg.capture.width == 0) {
            return fail(Status::BAD_VALUE, "capture.width");
        }
        if (!get_uint(cap, "height", cfg.capture.height) || cfg.capture.height == 0) {
            return fail(Status::BAD_VALUE, "capture.height");
        }
    }

    if (root.isMember("sync")) {
        const Json::Value& sync = root["sync"];
        if (!sync.isObject()) return fail(Status::BAD_VALUE, "sync");

        if (!get_uint(sync, "period_ms", cfg.sync.period_ms) || cfg.sync.period_ms == 0) {
            return fail(Status::BAD_VALUE, "sync.period_ms");
        }
        if (!get_uint(sync, "max_failures", cfg.sync.max_failures)) {
            return fail(Status::BAD_VALUE, "sync.max_failures");
        }
        if (sync.isMember("region")) {
            const Json::Value& r = sync["region"];
            if (!r.isArray() || r.size() != 4) return fail(Status::BAD_VALUE, "sync.region");
            double v[4];
            for (Json::ArrayIndex i = 0; i < 4; ++i) {
                if (!r[i].isNumeric() || !in_unit(r[i].asDouble())) {
                    return fail(Status::BAD_VALUE, "sync.region");
                }
                v[i] = r[i].asDouble();
            }
            cfg.sync.region.left   = v[0];
            cfg.sync.region.top    = v[1];
            cfg.sync.region.right  = v[2];
            cfg.sync.region.bottom = v[3];
        }
    }

    out = cfg;
    return true;
}

bool ConfigStore::Save(const AppConfig& cfg) {
    // Reseting any previous errors
    m_status = Status::OK;
    m_detail.clear();

    // Start from what is on disk so unknown keys survive.
    Json::Value root;
    std::string errs;
    bool found = false;
    if (!read_document(m_path, root, errs, found) || !root.isObject()) {
        root = Json::Value(Json::objectValue);
    }

    root["host"]    = cfg.host;
    root["app_key"] = cfg.app_key;

    Json::Value& cap = root["capture"];
    if (!cap.isObject()) cap = Json::Value(Json::objectValue);
    cap["source"] = cfg.capture.source;
    cap["device"] = cfg.capture.device;
    if (!cfg.capture.pipeline_source.empty()) {
        cap["pipeline_source"] = cfg.capture.pipeline_source;
    } else {
        cap.removeMember("pipeline_source");
    }
    cap["width"]  = cfg.capture.width;
    cap["height"] = cfg.capture.height;

    Json::Value& sync = root["sync"];
    if (!sync.isObject()) sync = Json::Value(Json::objectValue);
    sync["period_ms"]    = cfg.sync.period_ms;
    sync["max_failures"] = cfg.sync.max_failures;
    Json::Value region(Json::arrayValue);
    region.append(cfg.sync.region.left);
    region.append(cfg.sync.region.top);
    region.append(cfg.sync.region.right);
    region.append(cfg.sync.region.bottom);
    sync["region"] = region;

    Json::StreamWriterBuilder wb;
    wb["indentation"] = "  ";
    wb["precision"] = 15;  // keeps user-entered region fractions exact

    const std::string tmp = m_path + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) return fail(Status::WRITE_FAIL, tmp);
        ofs << Json::writeString(wb, root) << "\n";
        if (!ofs.good()) return fail(Status::WRITE_FAIL, tmp);
    }

    std::error_code ec;
    fs::rename(tmp, m_path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return fail(Status::WRITE_FAIL, m_path);
    }
    return true;
}

bool ConfigStore::fail(Status s, const std::string& detail) {
    m_status = s;
    m_detail = detail;
    return false;
}

const char* ConfigStore::StatusStr(Status s) {
    switch (s) {
        case Status::OK:         return "OK";
        case Status::NOT_FOUND:  return "NOT_FOUND";
        case Status::READ_FAIL:  return "READ_FAIL";
        case Status::PARSE_FAIL: return "PARSE_FAIL";
        case Status::BAD_VALUE:  return "BAD_VALUE";
        case Status::WRITE_FAIL: return "WRITE_FAIL";
        default:                 return "UNKNOWN";
    }
}

bool ParseRegion(const std::string& text, msg::Region& out) {
    std::istringstream is(text);
    std::string item;
    double v[4];
    int n = 0;

    while (std::getline(is, item, ',')) {
        if (n >= 4 || item.empty()) return false;
        char* end = nullptr;
        const double d = std::strtod(item.c_str(), &end);
        if (end == item.c_str() || *end != '\0' || !in_unit(d)) return false;
        v[n++] = d;
    }
    if (n != 4) return false;

    out.left   = v[0];
    out.top    = v[1];
    out.right  = v[2];
    out.bottom = v[3];
    return true;
}

} // namespace hueru
