// hueru: drive Hue lights from the command line or from the live screen.
//
//   hueru configure <host> <app_key>
//   hueru set <light_id> rgb <r> <g> <b>
//   hueru xy <r> <g> <b>
//   hueru screen <light_id> [--region L,T,R,B] [--period MS] [--source screen|v4l2]
//                           [--device PATH] [--dry-run] [--verbose]
//   hueru probe [--region L,T,R,B] [--period MS] [--source screen|v4l2] [--device PATH]
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include <getopt.h>
#include <signal.h>

#include "os/rtos.hpp"
#include "apps/core/Config.hpp"
#include "apps/color/ColorConverter.hpp"
#include "apps/hub/HueClient.hpp"
#include "apps/hub/ConsoleLightClient.hpp"
#include "apps/screen/FrameSampler.hpp"
#include "apps/screen/ScreenSync.hpp"
#include "platform/linux/ScreenCastBackend.hpp"
#include "platform/linux/V4l2Backend.hpp"

namespace {

constexpr int EXIT_OK    = 0;
constexpr int EXIT_FAIL  = 1;
constexpr int EXIT_USAGE = 2;

// Global flag for clean shutdown
std::atomic<bool> g_stop{false};
std::atomic<screen::ScreenSync*> g_sync{nullptr};

void signalHandler(int) {
    g_stop.store(true);
    screen::ScreenSync* sync = g_sync.load();
    if (sync) sync->RequestStop();
}

void installSignalHandlers() {
    // No SA_RESTART: a pending sleep returns early so the loop exits promptly.
    struct sigaction sa{};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
}

void printUsage(std::ostream& os, const char* prog) {
    os << "Usage: " << prog << " [--config PATH] <command> [args]\n"
       << "\n"
       << "Commands:\n"
       << "  configure <host> <app_key>        store the bridge address and application key\n"
       << "  set <light_id> rgb <r> <g> <b>    set a light to an RGB color\n"
       << "  xy <r> <g> <b>                    print the xy chromaticity of an RGB color\n"
       << "  screen <light_id> [options]       drive a light from a screen region\n"
       << "  probe [options]                   print the region color continuously\n"
       << "\n"
       << "screen/probe options:\n"
       << "  -r, --region L,T,R,B   fractional region (default from config, whole frame)\n"
       << "  -p, --period MS        update period in ms (default 100)\n"
       << "  -s, --source NAME      capture source: screen | v4l2\n"
       << "  -d, --device PATH      V4L2 device node (v4l2 source)\n"
       << "  -n, --dry-run          print commands instead of sending them (screen)\n"
       << "  -v, --verbose          log every dispatched color (screen)\n";
}

bool parseByte(const char* s, uint8_t& out) {
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || v < 0 || v > 255) return false;
    out = static_cast<uint8_t>(v);
    return true;
}

bool parseRgb(char** argv, msg::Rgb8& out) {
    return parseByte(argv[0], out.r) && parseByte(argv[1], out.g) && parseByte(argv[2], out.b);
}

bool loadConfig(hueru::ConfigStore& store, hueru::AppConfig& cfg) {
    if (store.Load(cfg)) return true;
    if (store.lastStatus() == hueru::ConfigStore::Status::NOT_FOUND) return true; // defaults
    std::cerr << "[CONFIG] LOAD_FAIL path=" << store.path()
              << " status=" << hueru::ConfigStore::StatusStr(store.lastStatus())
              << " detail=" << store.lastDetail() << "\n";
    return false;
}

std::unique_ptr<hub::HueClient> makeHueClient(const hueru::AppConfig& cfg, const std::string& cfg_path) {
    if (!cfg.hasHub()) {
        std::cerr << "No bridge configured in " << cfg_path
                  << ". Run: hueru configure <host> <app_key>\n";
        return nullptr;
    }
    hub::HueClientConfig hc;
    if (!hub::HueClient::ParseHost(cfg.host, hc.host, hc.port)) {
        std::cerr << "Invalid host in " << cfg_path << ": \"" << cfg.host << "\"\n";
        return nullptr;
    }
    hc.app_key = cfg.app_key;
    return std::make_unique<hub::HueClient>(hc);
}

std::unique_ptr<platform::ICaptureBackend> makeBackend(const hueru::CaptureSettings& cap) {
    if (cap.source == "v4l2") {
        platform::V4l2Config vc;
        vc.dev = cap.device.c_str();   // `cap` outlives the backend
        return std::make_unique<platform::V4l2Backend>(vc);
    }
    platform::ScreenCastConfig sc;
    if (!cap.pipeline_source.empty()) sc.source = cap.pipeline_source;
    return std::make_unique<platform::ScreenCastBackend>(sc);
}

// -------------------- commands --------------------

int cmdConfigure(hueru::ConfigStore& store, int argc, char** argv) {
    if (argc != 3) return EXIT_USAGE;

    hueru::AppConfig cfg;
    if (!loadConfig(store, cfg)) return EXIT_FAIL;

    std::string host;
    uint16_t port = 80;
    if (!hub::HueClient::ParseHost(argv[1], host, port)) {
        std::cerr << "Invalid host: \"" << argv[1] << "\"\n";
        return EXIT_USAGE;
    }

    cfg.host = argv[1];
    cfg.app_key = argv[2];
    if (!store.Save(cfg)) {
        std::cerr << "[CONFIG] SAVE_FAIL path=" << store.path()
                  << " status=" << hueru::ConfigStore::StatusStr(store.lastStatus()) << "\n";
        return EXIT_FAIL;
    }
    std::cout << "Saved bridge " << cfg.host << " to " << store.path() << "\n";
    return EXIT_OK;
}

int cmdSet(hueru::ConfigStore& store, int argc, char** argv) {
    // set <light_id> rgb <r> <g> <b>
    if (argc != 6 || std::strcmp(argv[2], "rgb") != 0) return EXIT_USAGE;

    msg::Rgb8 rgb;
    if (!parseRgb(argv + 3, rgb)) {
        std::cerr << "RGB values must be integers in 0..255\n";
        return EXIT_USAGE;
    }

    hueru::AppConfig cfg;
    if (!loadConfig(store, cfg)) return EXIT_FAIL;
    auto light = makeHueClient(cfg, store.path());
    if (!light) return EXIT_FAIL;

    const msg::ChromaXY xy = color::RgbToXy(rgb);
    if (!light->SetLightColor(argv[1], xy, /*on=*/true)) {
        std::cerr << "Failed to set light " << argv[1] << ": "
                  << light->LastError();
        if (!light->lastHubError().empty()) std::cerr << " (" << light->lastHubError() << ")";
        std::cerr << "\n";
        return EXIT_FAIL;
    }

    std::cout << "Set light " << argv[1] << " to rgb("
              << int(rgb.r) << "," << int(rgb.g) << "," << int(rgb.b) << ")\n";
    return EXIT_OK;
}

int cmdXy(int argc, char** argv) {
    if (argc != 4) return EXIT_USAGE;

    msg::Rgb8 rgb;
    if (!parseRgb(argv + 1, rgb)) {
        std::cerr << "RGB values must be integers in 0..255\n";
        return EXIT_USAGE;
    }
    const msg::ChromaXY xy = color::RgbToXy(rgb);
    std::cout << std::fixed << std::setprecision(6) << xy.x << " " << xy.y << "\n";
    return EXIT_OK;
}

struct CaptureOptions {
    bool dry_run = false;
    bool verbose = false;
};

// Shared option parsing for screen/probe. Applies overrides onto cfg.
bool parseCaptureOptions(int argc, char** argv, hueru::AppConfig& cfg, CaptureOptions& opts) {
    static const option long_opts[] = {
        {"region",  required_argument, nullptr, 'r'},
        {"period",  required_argument, nullptr, 'p'},
        {"source",  required_argument, nullptr, 's'},
        {"device",  required_argument, nullptr, 'd'},
        {"dry-run", no_argument,       nullptr, 'n'},
        {"verbose", no_argument,       nullptr, 'v'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0; // glibc: full re-init for the sub-command argv
    int c;
    while ((c = getopt_long(argc, argv, "r:p:s:d:nv", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'r':
                if (!hueru::ParseRegion(optarg, cfg.sync.region)) {
                    std::cerr << "Invalid region \"" << optarg << "\" (expected L,T,R,B in 0..1)\n";
                    return false;
                }
                break;
            case 'p': {
                char* end = nullptr;
                const long v = std::strtol(optarg, &end, 10);
                if (end == optarg || *end != '\0' || v <= 0) {
                    std::cerr << "Invalid period \"" << optarg << "\"\n";
                    return false;
                }
                cfg.sync.period_ms = static_cast<uint32_t>(v);
                break;
            }
            case 's':
                if (std::strcmp(optarg, "screen") != 0 && std::strcmp(optarg, "v4l2") != 0) {
                    std::cerr << "Unknown source \"" << optarg << "\"\n";
                    return false;
                }
                cfg.capture.source = optarg;
                break;
            case 'd':
                cfg.capture.device = optarg;
                break;
            case 'n': opts.dry_run = true; break;
            case 'v': opts.verbose = true; break;
            default:
                return false;
        }
    }
    return true;
}

bool startSampler(screen::FrameSampler& sampler, const platform::ICaptureBackend& backend) {
    if (sampler.Start()) return true;
    std::cerr << "Capture failed to start (" << backend.Name() << ": " << backend.LastError();
    if (backend.LastErrno() != 0) std::cerr << ", " << std::strerror(backend.LastErrno());
    std::cerr << ").";
    if (std::strcmp(backend.Name(), "screen") == 0) {
        std::cerr << " Check that PipeWire and xdg-desktop-portal are running"
                     " and that screen sharing was allowed.";
    }
    std::cerr << "\n";
    return false;
}

int cmdScreen(hueru::ConfigStore& store, int argc, char** argv) {
    hueru::AppConfig cfg;
    if (!loadConfig(store, cfg)) return EXIT_FAIL;

    CaptureOptions opts;
    if (!parseCaptureOptions(argc, argv, cfg, opts)) return EXIT_USAGE;
    if (optind != argc - 1) return EXIT_USAGE;
    const std::string light_id = argv[optind];

    std::unique_ptr<hub::ILightClient> light;
    if (opts.dry_run) {
        light = std::make_unique<hub::ConsoleLightClient>(std::cout);
    } else {
        light = makeHueClient(cfg, store.path());
        if (!light) return EXIT_FAIL;
    }

    auto backend = makeBackend(cfg.capture);

    screen::FrameSamplerConfig fs_cfg;
    fs_cfg.width  = cfg.capture.width;
    fs_cfg.height = cfg.capture.height;

    // Sampler closes on every path out of this scope.
    screen::FrameSampler sampler(*backend, fs_cfg);
    if (!startSampler(sampler, *backend)) return EXIT_FAIL;

    screen::ScreenSyncConfig sync_cfg;
    sync_cfg.light_id = light_id;
    sync_cfg.region = cfg.sync.region;
    sync_cfg.period_ms = cfg.sync.period_ms;
    sync_cfg.max_consecutive_failures = cfg.sync.max_failures;
    sync_cfg.verbose = opts.verbose;

    screen::ScreenSync sync(sampler, *light, sync_cfg);
    g_sync.store(&sync);
    if (g_stop.load()) sync.RequestStop();

    const screen::ScreenSync::Status st = sync.Run();

    g_sync.store(nullptr);
    sampler.Close();

    if (st != screen::ScreenSync::Status::OK) {
        std::cerr << "Screen sync stopped: " << screen::ScreenSync::StatusStr(st) << "\n";
        return EXIT_FAIL;
    }
    return EXIT_OK;
}

int cmdProbe(hueru::ConfigStore& store, int argc, char** argv) {
    hueru::AppConfig cfg;
    if (!loadConfig(store, cfg)) return EXIT_FAIL;

    CaptureOptions opts;
    if (!parseCaptureOptions(argc, argv, cfg, opts)) return EXIT_USAGE;
    if (optind != argc) return EXIT_USAGE;

    auto backend = makeBackend(cfg.capture);

    screen::FrameSamplerConfig fs_cfg;
    fs_cfg.width  = cfg.capture.width;
    fs_cfg.height = cfg.capture.height;

    screen::FrameSampler sampler(*backend, fs_cfg);
    if (!startSampler(sampler, *backend)) return EXIT_FAIL;

    while (!g_stop.load()) {
        const msg::Rgb8 c = sampler.GetRegionColor(cfg.sync.region);
        std::cout << "\rRegion color: (" << int(c.r) << ", " << int(c.g) << ", " << int(c.b) << ")   "
                  << std::flush;
        Rtos::SleepMs(static_cast<int>(cfg.sync.period_ms));
    }
    std::cout << "\nExiting.\n";
    return EXIT_OK;
}

} // anonymous namespace

int main(int argc, char** argv) {
    static const option global_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"help",   no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    std::string config_path = hueru::ConfigStore::DEFAULT_PATH;

    int c;
    // '+': stop at the first non-option (the command)
    while ((c = getopt_long(argc, argv, "+c:h", global_opts, nullptr)) != -1) {
        switch (c) {
            case 'c': config_path = optarg; break;
            case 'h': printUsage(std::cout, argv[0]); return EXIT_OK;
            default:  printUsage(std::cerr, argv[0]); return EXIT_USAGE;
        }
    }

    if (optind >= argc) {
        printUsage(std::cerr, argv[0]);
        return EXIT_USAGE;
    }

    installSignalHandlers();

    hueru::ConfigStore store(config_path);

    const std::string cmd = argv[optind];
    const int sub_argc = argc - optind;
    char** sub_argv = argv + optind;

    int rc = EXIT_USAGE;
    if (cmd == "configure")   rc = cmdConfigure(store, sub_argc, sub_argv);
    else if (cmd == "set")    rc = cmdSet(store, sub_argc, sub_argv);
    else if (cmd == "xy")     rc = cmdXy(sub_argc, sub_argv);
    else if (cmd == "screen") rc = cmdScreen(store, sub_argc, sub_argv);
    else if (cmd == "probe")  rc = cmdProbe(store, sub_argc, sub_argv);
    else std::cerr << "Unknown command \"" << cmd << "\"\n";

    if (rc == EXIT_USAGE) printUsage(std::cerr, argv[0]);
    return rc;
}
