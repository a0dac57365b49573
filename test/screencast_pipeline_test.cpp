// test/screencast_pipeline_test.cpp
// Launch strings only; nothing is opened.
#include <iostream>
#include <string>

#include "platform/linux/ScreenCastBackend.hpp"

static int g_fail = 0;

static void check(bool ok, const char* what) {
    std::cout << "  " << (ok ? "PASS" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_fail;
}

static bool has(const std::string& s, const char* part) { return s.find(part) != std::string::npos; }

static size_t count(const std::string& s, const char* part) {
    size_t n = 0;
    for (size_t p = s.find(part); p != std::string::npos; p = s.find(part, p + 1)) ++n;
    return n;
}

int main() {
    std::cout << "=== screencast_pipeline_test ===\n";

    std::cout << "\n[Test 1] Default portal pipeline\n";
    {
        platform::ScreenCastBackend backend;
        const std::string p = backend.PipelineString(160, 90);
        std::cout << "  " << p << "\n";
        check(p.compare(0, 11, "pipewiresrc") == 0, "starts with pipewiresrc");
        check(has(p, "media.role=Screen"), "asks for a screen-sharing portal session");
        check(count(p, "keepalive-time") == 1, "keepalive-time present once");
        check(has(p, "format=BGR,width=160,height=90"), "BGR caps at target size");
        check(has(p, "appsink max-buffers=1 drop=true"), "single-buffer, drop-old appsink");
    }

    std::cout << "\n[Test 2] Custom pipewiresrc without keepalive gets one\n";
    {
        platform::ScreenCastConfig cfg;
        cfg.source = "pipewiresrc path=42";
        platform::ScreenCastBackend backend(cfg);
        const std::string p = backend.PipelineString(32, 18);
        check(p.compare(0, 37, "pipewiresrc keepalive-time=1000 path=") == 0, "keepalive-time inserted after element");
        check(count(p, "keepalive-time") == 1, "only once");
    }

    std::cout << "\n[Test 3] Custom keepalive is kept\n";
    {
        platform::ScreenCastConfig cfg;
        cfg.source = "pipewiresrc keepalive-time=250";
        platform::ScreenCastBackend backend(cfg);
        const std::string p = backend.PipelineString(32, 18);
        check(has(p, "keepalive-time=250") && count(p, "keepalive-time") == 1, "user value untouched");
    }

    std::cout << "\n[Test 4] Other sources are left alone\n";
    {
        platform::ScreenCastConfig cfg;
        cfg.source = "videotestsrc is-live=true";
        platform::ScreenCastBackend backend(cfg);
        const std::string p = backend.PipelineString(32, 18);
        check(p.compare(0, 25, "videotestsrc is-live=true") == 0 && !has(p, "keepalive-time"), "no keepalive added");
    }

    std::cout << "\nscreencast_pipeline_test: " << (g_fail ? "FAIL" : "PASS") << "\n";
    return g_fail ? 1 : 0;
}
