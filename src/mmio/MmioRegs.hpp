#pragma once

#include <atomic>
#include <memory>
#include "common/Types.hpp"
#include "irq/InterruptStatus.hpp"

// ── virtio-mmio interrupt registers ───────────────────────────────────────────
// Guest-facing decoder for the interrupt slice of a virtio-mmio device window.
// The transport's full register handler forwards these offsets here:
//
//   0x060  InterruptStatus   (R)  snapshot of the shared status register
//   0x064  InterruptACK      (W)  clears the written bits, others untouched
//   0x0FC  ConfigGeneration  (R)  changes whenever device config changes
//
// Accesses are 32-bit only, as virtio-mmio requires for these
// registers.  Anything else is logged and read as 0 / ignored.
//
// Holds its own reference to the status register (MmioIrq::status_register())
// so it can outlive a reset of the controller object.
class MmioRegs {
public:
    explicit MmioRegs(std::shared_ptr<InterruptStatus> status) noexcept;

    // ── Guest register access ─────────────────────────────────────────────────
    [[nodiscard]] u32 read32 (u32 off) const noexcept;
    void              write32(u32 off, u32 value) noexcept;

    // ── Device side ───────────────────────────────────────────────────────────
    // Call before MmioIrq::signal_configuration_change() so a driver that sees the
    // CONFIG_INTERRUPT bit also sees the new generation.
    void bump_config_generation() noexcept {
        config_gen_.fetch_add(1u, std::memory_order_seq_cst);
    }

    [[nodiscard]] u32 config_generation() const noexcept {
        return config_gen_.load(std::memory_order_seq_cst);
    }

private:
    std::shared_ptr<InterruptStatus> status_;
    std::atomic<u32>                 config_gen_{0};
};

