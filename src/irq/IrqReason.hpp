#pragma once

#include "common/Types.hpp"

// ── Notification reasons ──────────────────────────────────────────────────────
// InterruptStatus bit positions.  Fixed by the virtio-mmio register layout, so
// they never change for the lifetime of a device.
enum class IrqReason : u32 {
    UsedQueueActivity   = 0,   // device placed buffers in a used ring
    ConfigurationChange = 1,   // device configuration space changed
};

namespace VMM {

[[nodiscard]] constexpr u32 reason_bit(IrqReason r) noexcept {
    return 1u << static_cast<u32>(r);
}

// Every bit a transport may ever set in InterruptStatus.
inline constexpr u32 IRQ_REASON_MASK =
    reason_bit(IrqReason::UsedQueueActivity) | reason_bit(IrqReason::ConfigurationChange);

static_assert(reason_bit(IrqReason::UsedQueueActivity)   == VRING_INTERRUPT);
static_assert(reason_bit(IrqReason::ConfigurationChange) == CONFIG_INTERRUPT);

} // namespace VMM
