#pragma once

#include <cstdint>
#include <cstddef>

// ── Scalar type aliases ────────────────────────────────────────────────────────
using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using s8  = std::int8_t;
using s16 = std::int16_t;
using s32 = std::int32_t;
using s64 = std::int64_t;

// ── virtio-mmio interrupt register layout ─────────────────────────────────────
namespace VMM {

// Offsets are relative to the device's MMIO window base.  Only the registers
// that carry interrupt state are listed; the rest of the virtio-mmio layout
// (queue selection, feature negotiation, device config space) belongs to the
// transport framework around this library.
//
//   0x060  InterruptStatus   (R)  pending notification reasons
//   0x064  InterruptACK      (W)  write-1-to-clear for InterruptStatus
//   0x0FC  ConfigGeneration  (R)  bumped on every device config change
//
inline constexpr u32 MMIO_INTERRUPT_STATUS  = 0x060u;
inline constexpr u32 MMIO_INTERRUPT_ACK     = 0x064u;
inline constexpr u32 MMIO_CONFIG_GENERATION = 0x0FCu;

// InterruptStatus bit values (virtio 1.x, section 4.2.2).
inline constexpr u32 VRING_INTERRUPT  = 0x1u;   // used buffer notification
inline constexpr u32 CONFIG_INTERRUPT = 0x2u;   // configuration change

} // namespace VMM
