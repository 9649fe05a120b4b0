#include "DemoDevices.hpp"

#include <cstdio>
#include <utility>

std::error_code FlakySink::trigger() noexcept {
    const u32 n = calls_.fetch_add(1u) + 1u;
    if (fail_every_ != 0u && n % fail_every_ == 0u) {
        return std::make_error_code(std::errc::io_error);
    }
    return inner_->trigger();
}

std::unique_ptr<Device> make_device(std::shared_ptr<NotificationSink> line) {
    auto dev  = std::make_unique<Device>();
    dev->irq  = std::make_unique<MmioIrq>(std::move(line));
    dev->regs = std::make_unique<MmioRegs>(dev->irq->status_register());
    return dev;
}

// ── Device thread ─────────────────────────────────────────────────────────────
void run_device(int id, Device& dev, u32 events) {
    int logged = 0;
    for (u32 i = 0; i < events; ++i) {
        IrqResult res;
        if (i % 8u == 7u) {
            dev.regs->bump_config_generation();
            res = dev.irq->signal_configuration_change();
        } else {
            res = dev.irq->signal_used_queue();
        }
        if (!res) {
            // Not fatal here: the bit is still set and the driver sweeps all
            // devices on every wakeup and timeout.
            dev.failures.fetch_add(1u);
            if (++logged <= 5)
                std::fprintf(stderr, "[Demo] dev%d: %s\n", id, res.error.message().c_str());
        }
    }
}

// ── Driver side ───────────────────────────────────────────────────────────────
bool service(std::vector<std::unique_ptr<Device>>& devices, Counts& c) {
    bool any = false;
    for (auto& dev : devices) {
        const u32 stat = dev->regs->read32(VMM::MMIO_INTERRUPT_STATUS);
        if (stat == 0u) continue;
        any = true;
        if (stat & VMM::VRING_INTERRUPT)  ++c.used;
        if (stat & VMM::CONFIG_INTERRUPT) {
            ++c.config;
            (void)dev->regs->read32(VMM::MMIO_CONFIG_GENERATION);
        }
        dev->regs->write32(VMM::MMIO_INTERRUPT_ACK, stat);
    }
    return any;
}
