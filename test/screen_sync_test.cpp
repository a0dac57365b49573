// test/screen_sync_test.cpp
#include <cmath>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "apps/hub/ConsoleLightClient.hpp"
#include "apps/hub/ILightClient.hpp"
#include "apps/screen/FrameSampler.hpp"
#include "apps/screen/ScreenSync.hpp"
#include "os/rtos.hpp"
#include "FakeCaptureBackend.hpp"

static int g_fail = 0;

static void check(bool ok, const char* what) {
    std::cout << "  " << (ok ? "PASS" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_fail;
}

namespace {

struct SentCommand {
    std::string light_id;
    msg::ChromaXY xy;
    bool on = false;
};

// Records every command; fails the first `fail_first` calls (or all of them).
class RecordingLightClient : public hub::ILightClient {
public:
    bool SetLightColor(const std::string& light_id, const msg::ChromaXY& xy, bool on) override {
        std::lock_guard<Rtos::Mutex> lk(m_lock);
        SentCommand c;
        c.light_id = light_id;
        c.xy = xy;
        c.on = on;
        sent.push_back(c);
        if (always_fail || sent.size() <= fail_first) return false;
        return true;
    }

    const char* LastError() const override { return "HUB_ERROR"; }

    size_t Count() {
        std::lock_guard<Rtos::Mutex> lk(m_lock);
        return sent.size();
    }

    std::vector<SentCommand> sent;
    size_t fail_first = 0;
    bool always_fail = false;

private:
    Rtos::Mutex m_lock;
};

struct StopCtx {
    screen::ScreenSync* sync = nullptr;
    RecordingLightClient* client = nullptr;
};

// Waits for a few commands, then asks the loop to stop (as the signal handler does).
void StopperEntry(void* arg) {
    auto* ctx = static_cast<StopCtx*>(arg);
    const uint64_t deadline = Rtos::MonoUs() + 2000000ull;
    while (ctx->client->Count() < 3 && Rtos::MonoUs() < deadline) {
        Rtos::SleepMs(5);
    }
    ctx->sync->RequestStop();
}

bool near(double a, double b, double tol) { return std::fabs(a - b) <= tol; }

} // anonymous namespace

int main() {
    std::cout << "=== screen_sync_test ===\n";

    std::cout << "\n[Test 1] One command per iteration with the region color\n";
    {
        FakeCaptureBackend backend;
        screen::FrameSampler sampler(backend, {32, 18});
        check(sampler.Start(), "sampler Start()");
        backend.Push(FakeCaptureBackend::Solid(32, 18, msg::Rgb8{255, 0, 0}, 1));
        check(WaitForFrame(sampler, 1), "red frame published");

        RecordingLightClient client;
        screen::ScreenSyncConfig cfg;
        cfg.light_id = "3";
        cfg.period_ms = 10;
        screen::ScreenSync sync(sampler, client, cfg);

        check(sync.Run(3) == screen::ScreenSync::Status::OK, "Run(3) returns OK");
        check(sync.Iterations() == 3, "3 iterations");
        check(client.sent.size() == 3, "3 commands sent");

        bool all_ok = !client.sent.empty();
        for (const auto& c : client.sent) {
            all_ok = all_ok && c.light_id == "3" && c.on
                  && near(c.xy.x, 0.7350, 1e-4) && near(c.xy.y, 0.2650, 1e-4);
        }
        check(all_ok, "each command: light 3, on, xy ~ (0.7350, 0.2650)");
        check(sync.LastColor() == (msg::Rgb8{255, 0, 0}), "last color is red");
    }

    std::cout << "\n[Test 2] Region selects the part of the frame that is sent\n";
    {
        FakeCaptureBackend backend;
        screen::FrameSampler sampler(backend, {100, 100});
        check(sampler.Start(), "sampler Start()");
        backend.Push(FakeCaptureBackend::Split(100, 100, msg::Rgb8{0, 0, 0}, msg::Rgb8{0, 0, 255}));
        check(WaitForFrame(sampler, 0), "frame published");

        RecordingLightClient client;
        screen::ScreenSyncConfig cfg;
        cfg.light_id = "1";
        cfg.period_ms = 10;
        cfg.region.left = 0.5f;
        screen::ScreenSync sync(sampler, client, cfg);

        check(sync.Run(1) == screen::ScreenSync::Status::OK, "Run(1)");
        check(sync.LastColor() == (msg::Rgb8{0, 0, 255}), "right half is blue");
        check(client.sent.size() == 1 && client.sent[0].xy.x < 0.2 && client.sent[0].xy.y < 0.1,
              "blue chromaticity sent");

        cfg.region.left = 0.0f;
        cfg.region.right = 0.5f;
        screen::ScreenSync sync_black(sampler, client, cfg);
        check(sync_black.Run(1) == screen::ScreenSync::Status::OK, "Run(1) on black half");
        check(client.sent.size() == 2 && client.sent[1].xy.x == 0.0 && client.sent[1].xy.y == 0.0,
              "black half sends (0,0)");
    }

    std::cout << "\n[Test 3] Consecutive hub failures stop the loop\n";
    {
        FakeCaptureBackend backend;
        screen::FrameSampler sampler(backend, {16, 9});
        check(sampler.Start(), "sampler Start()");

        RecordingLightClient client;
        client.always_fail = true;
        screen::ScreenSyncConfig cfg;
        cfg.light_id = "1";
        cfg.period_ms = 10;
        cfg.max_consecutive_failures = 2;
        screen::ScreenSync sync(sampler, client, cfg);

        check(sync.Run(100) == screen::ScreenSync::Status::HUB_FAIL, "Run() -> HUB_FAIL");
        check(client.sent.size() == 2, "stopped after 2 failed sends");
        check(sync.SendsFailed() == 2, "SendsFailed() == 2");
    }

    std::cout << "\n[Test 4] A success resets the failure budget\n";
    {
        FakeCaptureBackend backend;
        screen::FrameSampler sampler(backend, {16, 9});
        check(sampler.Start(), "sampler Start()");

        RecordingLightClient client;
        client.fail_first = 1;
        screen::ScreenSyncConfig cfg;
        cfg.light_id = "1";
        cfg.period_ms = 10;
        cfg.max_consecutive_failures = 2;
        screen::ScreenSync sync(sampler, client, cfg);

        check(sync.Run(4) == screen::ScreenSync::Status::OK, "Run(4) -> OK");
        check(sync.SendsFailed() == 1, "one failure counted");
        check(client.sent.size() == 4, "4 commands sent");
    }

    std::cout << "\n[Test 5] Not ready\n";
    {
        FakeCaptureBackend backend;
        screen::FrameSampler sampler(backend, {16, 9});

        RecordingLightClient client;
        screen::ScreenSyncConfig cfg;
        cfg.light_id = "1";
        screen::ScreenSync sync(sampler, client, cfg);
        check(sync.Run(1) == screen::ScreenSync::Status::NOT_READY, "sampler not started -> NOT_READY");

        check(sampler.Start(), "sampler Start()");
        cfg.light_id.clear();
        screen::ScreenSync no_light(sampler, client, cfg);
        check(no_light.Run(1) == screen::ScreenSync::Status::NOT_READY, "empty light id -> NOT_READY");
        check(client.sent.empty(), "nothing sent");
    }

    std::cout << "\n[Test 6] RequestStop() from another task ends Run()\n";
    {
        FakeCaptureBackend backend;
        screen::FrameSampler sampler(backend, {16, 9});
        check(sampler.Start(), "sampler Start()");

        RecordingLightClient client;
        screen::ScreenSyncConfig cfg;
        cfg.light_id = "2";
        cfg.period_ms = 10;
        screen::ScreenSync sync(sampler, client, cfg);

        StopCtx ctx;
        ctx.sync = &sync;
        ctx.client = &client;
        Rtos::Task stopper;
        check(stopper.Create("Stopper", StopperEntry, &ctx), "stopper task");

        check(sync.Run() == screen::ScreenSync::Status::OK, "Run() -> OK after stop request");
        stopper.Join();
        check(client.Count() >= 3, "ran until stopped");
        check(sync.StopRequested(), "stop flag set");
    }

    std::cout << "\n[Test 7] Dry-run client prints the command\n";
    {
        std::ostringstream out;
        hub::ConsoleLightClient console(out);
        msg::ChromaXY xy;
        xy.x = 0.735;
        xy.y = 0.265;
        check(console.SetLightColor("5", xy, true), "SetLightColor()");
        const std::string line = out.str();
        check(line.find("light=5") != std::string::npos, "names the light");
        check(line.find("0.7350") != std::string::npos && line.find("0.2650") != std::string::npos,
              "prints xy with 4 decimals");
        check(console.Calls() == 1, "Calls() == 1");
    }

    std::cout << "\nscreen_sync_test: " << (g_fail ? "FAIL" : "PASS") << "\n";
    return g_fail ? 1 : 0;
}
