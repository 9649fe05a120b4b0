#pragma once

#include <atomic>
#include <memory>
#include <system_error>
#include <utility>
#include <vector>
#include "common/Types.hpp"
#include "irq/MmioIrq.hpp"
#include "irq/NotificationSink.hpp"
#include "mmio/MmioRegs.hpp"

// ── Demo device model ─────────────────────────────────────────────────────────
// The pieces vmm_irq_demo is built from: emulated devices that signal from
// their own threads, and the driver-side sweep that reads InterruptStatus and
// acks it through the register window.

// ── Fault injection ───────────────────────────────────────────────────────────
// Wraps a real sink and fails every Nth trigger with EIO, so a run shows what
// a broken notification channel looks like from the device side.
// fail_every == 0 never fails.
class FlakySink final : public NotificationSink {
public:
    FlakySink(std::shared_ptr<NotificationSink> inner, u32 fail_every) noexcept
        : inner_(std::move(inner)), fail_every_(fail_every) {}

    [[nodiscard]] std::error_code trigger() noexcept override;

    [[nodiscard]] u32 calls() const noexcept { return calls_.load(); }

private:
    std::shared_ptr<NotificationSink> inner_;
    u32                               fail_every_;
    std::atomic<u32>                  calls_{0};
};

// One emulated virtio-mmio device: its controller plus the register window
// the driver loop reads through.
struct Device {
    std::unique_ptr<MmioIrq>  irq;
    std::unique_ptr<MmioRegs> regs;
    std::atomic<u64>          failures{0};
};

std::unique_ptr<Device> make_device(std::shared_ptr<NotificationSink> line);

// Device thread body.  Mostly used-ring activity, with a config change (and a
// ConfigGeneration bump) every 8th event.  Failed signals are counted in
// dev.failures and the first few are logged.
void run_device(int id, Device& dev, u32 events);

struct Counts {
    u64 wakeups = 0;
    u64 used    = 0;
    u64 config  = 0;
};

// Driver sweep: read InterruptStatus, handle, write the same bits to
// InterruptACK.  Returns true if any device had something pending.
bool service(std::vector<std::unique_ptr<Device>>& devices, Counts& c);
