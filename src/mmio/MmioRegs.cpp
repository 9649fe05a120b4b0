#include "MmioRegs.hpp"

#include <cstdio>
#include <utility>

MmioRegs::MmioRegs(std::shared_ptr<InterruptStatus> status) noexcept
    : status_(std::move(status))
{}

// ── MMIO read (32-bit) ────────────────────────────────────────────────────────
u32 MmioRegs::read32(u32 off) const noexcept {
    if (off == VMM::MMIO_INTERRUPT_STATUS)  return status_->snapshot();
    if (off == VMM::MMIO_CONFIG_GENERATION) return config_generation();

    // InterruptACK is write-only.
    std::fprintf(stderr, "[Mmio] unhandled read32  off=0x%03X\n", off);
    return 0u;
}

// ── MMIO write (32-bit) ───────────────────────────────────────────────────────
void MmioRegs::write32(u32 off, u32 value) noexcept {
    if (off == VMM::MMIO_INTERRUPT_ACK) {
        // Bits that are not pending (or not defined) clear nothing.
        status_->acknowledge(value);
        return;
    }

    std::fprintf(stderr, "[Mmio] unhandled write32 off=0x%03X val=0x%08X\n", off, value);
}

