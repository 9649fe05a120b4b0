#pragma once

#include "common/Types.hpp"
#include "irq/IrqError.hpp"

// ── Transport interrupt controller ────────────────────────────────────────────
// What a device sees of interrupt delivery, independent of the transport it is
// plugged into.  Devices call the two signal_* operations; the register
// handler for the transport calls status() and acknowledge().
//
// Signal contract, for every implementation:
//   1. the reason is recorded in the status state first,
//   2. only then is the guest notified.
// A notification failure is returned to the device and never undoes step 1:
// the event happened, only its delivery failed.  Nothing here retries or logs;
// the device decides whether a failed signal is fatal.
//
// Implementations:
//   MmioIrq   virtio-mmio: one status register, one shared notification line.
//
// PCI: without MSI-X a PCI transport behaves like MmioIrq (ISR status byte,
// INTx line, read-to-clear instead of an ACK register).  With MSI-X enabled
// each reason goes to its own message vector and the ISR byte is unused.  That
// variant belongs behind this interface as a separate class; the vector
// mapping (config vector vs. per-queue vectors) is not designed yet.
class TransportIrq {
public:
    virtual ~TransportIrq() = default;

    // ── Device interface ──────────────────────────────────────────────────────
    virtual IrqResult signal_used_queue()    noexcept = 0;
    virtual IrqResult signal_configuration_change() noexcept = 0;

    // ── Register-handler interface ────────────────────────────────────────────
    virtual void acknowledge(u32 mask) noexcept = 0;
    [[nodiscard]] virtual u32 status() const noexcept = 0;
};

