#pragma once

#include <atomic>
#include "common/Types.hpp"

// ── Interrupt status register ─────────────────────────────────────────────────
// Backing store for the virtio-mmio InterruptStatus / InterruptACK pair:
//
//   InterruptStatus  (R)  bit 0 = used ring, bit 1 = config change
//   InterruptACK     (W)  write-1-to-clear (AND with the complement)
//
// Level semantics: a bit records "this happened since the driver last acked
// it", not how many times.  Signalling an already-set reason is a no-op, so
// devices may coalesce and must not assume one signal means one interrupt.
//
// Shared between the transport controller (writer) and the register-read path
// (reader/clearer), possibly on different threads.  Every access is a single
// seq_cst RMW or load, so a reader that starts after signal() returns always
// sees the bit.
//
// A signal() racing an acknowledge() of the same bit may end either way.  The
// driver re-reads InterruptStatus after acking if it cares about that window.
class InterruptStatus {
public:
    InterruptStatus() noexcept = default;
    InterruptStatus(const InterruptStatus&)            = delete;
    InterruptStatus& operator=(const InterruptStatus&) = delete;

    // ── Device side ───────────────────────────────────────────────────────────
    void signal(u32 bits) noexcept {
        stat_.fetch_or(bits, std::memory_order_seq_cst);
    }

    // ── Register-access side ──────────────────────────────────────────────────
    // Clears exactly the bits in `mask`; bits outside it are never touched,
    // including ones set concurrently.
    void acknowledge(u32 mask) noexcept {
        stat_.fetch_and(~mask, std::memory_order_seq_cst);
    }

    [[nodiscard]] u32 snapshot() const noexcept {
        return stat_.load(std::memory_order_seq_cst);
    }

private:
    std::atomic<u32> stat_{0};
};

static_assert(std::atomic<u32>::is_always_lock_free);

