#include <cstdlib>
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <atomic>
#include <memory>
#include <thread>
#include <utility>
#include <vector>
#include <poll.h>

#include "demo/DemoDevices.hpp"
#include "irq/EventFdSink.hpp"
#include "irq/SdlEventSink.hpp"

// ── main ──────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    // ── Parse flags ───────────────────────────────────────────────────────────
    bool use_sdl    = false;
    u32  n_devices  = 2u;
    u32  n_events   = 1000u;
    u32  fail_every = 0u;     // 0 = never

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--sink") == 0 && i + 1 < argc) {
            const char* kind = argv[++i];
            if (std::strcmp(kind, "sdl") == 0) {
                use_sdl = true;
            } else if (std::strcmp(kind, "eventfd") != 0) {
                std::fprintf(stderr, "Unknown sink '%s' (expected eventfd or sdl)\n", kind);
                return EXIT_FAILURE;
            }
        } else if (std::strcmp(argv[i], "--devices") == 0 && i + 1 < argc) {
            n_devices = static_cast<u32>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--events") == 0 && i + 1 < argc) {
            n_events = static_cast<u32>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--fail-every") == 0 && i + 1 < argc) {
            fail_every = static_cast<u32>(std::strtoul(argv[++i], nullptr, 10));
        } else {
            std::fprintf(stderr,
                "Usage: vmm_irq_demo [--sink eventfd|sdl] [--devices N] [--events N] [--fail-every N]\n");
            return EXIT_FAILURE;
        }
    }
    if (n_devices == 0u) {
        std::fprintf(stderr, "--devices must be at least 1\n");
        return EXIT_FAILURE;
    }

    // ── Notification line, shared by every device ────────────────────────────
    std::shared_ptr<EventFdSink>  efd;
    std::shared_ptr<SdlEventSink> sdl;
    std::shared_ptr<NotificationSink> line;

    if (use_sdl) {
        sdl = std::make_shared<SdlEventSink>();
        if (!sdl->ready()) {
            std::fprintf(stderr, "SDL event sink unavailable\n");
            return EXIT_FAILURE;
        }
        line = sdl;
    } else {
        efd = std::make_shared<EventFdSink>();
        if (const auto ec = efd->open()) {
            std::fprintf(stderr, "Failed to open eventfd: %s\n", ec.message().c_str());
            return EXIT_FAILURE;
        }
        line = efd;
    }
    if (fail_every != 0u) {
        line = std::make_shared<FlakySink>(line, fail_every);
    }

    std::vector<std::unique_ptr<Device>> devices;
    for (u32 i = 0; i < n_devices; ++i) {
        devices.push_back(make_device(line));
    }

    std::fprintf(stdout, "[Demo] %u device(s) x %u events on %s sink\n",
                 n_devices, n_events, use_sdl ? "sdl" : "eventfd");

    // ── Start device threads ──────────────────────────────────────────────────
    std::atomic<u32> running{n_devices};
    std::vector<std::thread> threads;
    threads.reserve(n_devices);
    for (u32 i = 0; i < n_devices; ++i) {
        threads.emplace_back([&, i] {
            run_device(static_cast<int>(i), *devices[i], n_events);
            running.fetch_sub(1u);
        });
    }

    // ── Driver loop ───────────────────────────────────────────────────────────
    // Wait for the line, then sweep.  A timeout also sweeps: that is how bits
    // whose notification failed still get handled.
    Counts counts;
    static constexpr int kWaitMs = 10;
    bool quit = false;

    for (;;) {
        bool woke = false;
        if (use_sdl) {
            const int n = sdl->wait(kWaitMs);
            if (n < 0) { quit = true; break; }
            woke = n > 0;
        } else {
            pollfd pfd{efd->fd(), POLLIN, 0};
            if (::poll(&pfd, 1, kWaitMs) > 0 && (pfd.revents & POLLIN)) {
                woke = efd->consume() != 0u;
            }
        }
        if (woke) ++counts.wakeups;

        const bool had_work = service(devices, counts);
        if (!had_work && running.load() == 0u) {
            // Devices are done; one more sweep after they stopped came back
            // empty, so nothing can still be pending.
            if (!service(devices, counts)) break;
        }
    }

    for (auto& t : threads) t.join();

    // ── Summary ───────────────────────────────────────────────────────────────
    u64 failures = 0u;
    u32 residual = 0u;
    for (const auto& dev : devices) {
        failures += dev->failures.load();
        residual |= dev->irq->status();
    }

    std::fprintf(stdout,
        "[Demo] wakeups=%llu used=%llu config=%llu failed_signals=%llu final_status=0x%X\n",
        static_cast<unsigned long long>(counts.wakeups),
        static_cast<unsigned long long>(counts.used),
        static_cast<unsigned long long>(counts.config),
        static_cast<unsigned long long>(failures),
        residual);

    if (quit) {
        std::fprintf(stdout, "[Demo] interrupted.\n");
        return EXIT_FAILURE;
    }
    return residual == 0u ? EXIT_SUCCESS : EXIT_FAILURE;
}
