#pragma once

#include <system_error>

// ── Notification sink ─────────────────────────────────────────────────────────
// "Make the guest see a pending interrupt."  That is the whole contract: no
// reason, no vector, no state visible to the caller.  How the notice reaches
// the guest (irqfd, a signalled event queue, an injected IRQ line) is up to
// the implementation.
//
// trigger() may be called from several device threads at once and must not
// block indefinitely.  Returns an empty error_code on success, otherwise the
// platform cause (usually an errno).  Callers never rely on the sink to know
// *why* it fired; that lives in InterruptStatus.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    [[nodiscard]] virtual std::error_code trigger() noexcept = 0;
};

