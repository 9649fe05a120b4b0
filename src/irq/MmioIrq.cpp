#include "MmioIrq.hpp"

#include <utility>

MmioIrq::MmioIrq(std::shared_ptr<InterruptStatus> status,
                 std::shared_ptr<NotificationSink> sink)
    : status_(status ? std::move(status) : std::make_shared<InterruptStatus>())
    , sink_  (std::move(sink))
{}

MmioIrq::MmioIrq(std::shared_ptr<NotificationSink> sink)
    : MmioIrq(std::make_shared<InterruptStatus>(), std::move(sink))
{}

IrqResult MmioIrq::signal_used_queue() noexcept {
    return raise(IrqReason::UsedQueueActivity, IrqErrorKind::SignalUsedQueueFailed);
}

IrqResult MmioIrq::signal_configuration_change() noexcept {
    return raise(IrqReason::ConfigurationChange, IrqErrorKind::SignalConfigurationChangeFailed);
}

// ── raise() ───────────────────────────────────────────────────────────────────
// The status bit must be globally visible before the guest can possibly take
// the interrupt, otherwise its handler may read InterruptStatus == 0 and drop
// the event.  signal() is a seq_cst RMW completed on this thread before
// trigger() is entered, which gives exactly that.
//
// On trigger failure the bit stays set.  A driver that polls, or the next
// successful trigger, will still find it.
IrqResult MmioIrq::raise(IrqReason reason, IrqErrorKind on_failure) noexcept {
    status_->signal(VMM::reason_bit(reason));

    if (!sink_) {
        return IrqResult::failure(on_failure, std::make_error_code(std::errc::no_such_device));
    }
    if (const std::error_code ec = sink_->trigger()) {
        return IrqResult::failure(on_failure, ec);
    }
    return IrqResult::success();
}

