#pragma once

#include <memory>
#include "irq/TransportIrq.hpp"
#include "irq/InterruptStatus.hpp"
#include "irq/NotificationSink.hpp"
#include "irq/IrqReason.hpp"

// ── virtio-mmio interrupt controller ──────────────────────────────────────────
// One per device, created with the device.  Owns nothing exclusively:
//   status_  shared with the register-read path (MmioRegs)
//   sink_    may be shared with other devices on the same line
//
// A null status gets a fresh register.  A null sink is a line that was never
// wired: signals still set the bit but report ENODEV.
class MmioIrq final : public TransportIrq {
public:
    MmioIrq(std::shared_ptr<InterruptStatus> status,
            std::shared_ptr<NotificationSink> sink);

    // Fresh status register, initially 0.
    explicit MmioIrq(std::shared_ptr<NotificationSink> sink);

    IrqResult signal_used_queue()    noexcept override;
    IrqResult signal_configuration_change() noexcept override;

    void acknowledge(u32 mask) noexcept override { status_->acknowledge(mask); }
    [[nodiscard]] u32 status() const noexcept override { return status_->snapshot(); }

    // Handle for the driver-facing register handler.
    [[nodiscard]] const std::shared_ptr<InterruptStatus>& status_register() const noexcept {
        return status_;
    }

private:
    std::shared_ptr<InterruptStatus>  status_;
    std::shared_ptr<NotificationSink> sink_;

    IrqResult raise(IrqReason reason, IrqErrorKind on_failure) noexcept;
};

