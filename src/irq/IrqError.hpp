#pragma once

#include <string>
#include <system_error>
#include "common/Types.hpp"

// ── Signal failure taxonomy ───────────────────────────────────────────────────
// A signal can only fail in one place: the notification sink.  The kind says
// which reason was being delivered; the cause is whatever the sink reported
// and is passed through untouched.
enum class IrqErrorKind : u8 {
    SignalUsedQueueFailed,
    SignalConfigurationChangeFailed,
};

[[nodiscard]] constexpr const char* to_string(IrqErrorKind k) noexcept {
    switch (k) {
    case IrqErrorKind::SignalUsedQueueFailed:    return "signal used queue failed";
    case IrqErrorKind::SignalConfigurationChangeFailed: return "signal configuration change failed";
    }
    return "unknown interrupt error";
}

struct InterruptError {
    IrqErrorKind    kind  = IrqErrorKind::SignalUsedQueueFailed;
    std::error_code cause {};

    // "<kind>: <cause message> (<errno>)", for the caller's log line.
    [[nodiscard]] std::string message() const;
};

// ── Signal result ─────────────────────────────────────────────────────────────
// Returned by every signal operation.  `ok == false` means the status bit was
// still set but the guest was not notified; see TransportIrq.hpp.
struct [[nodiscard]] IrqResult {
    bool           ok = true;
    InterruptError error{};

    static IrqResult success() noexcept { return {}; }
    static IrqResult failure(IrqErrorKind kind, std::error_code cause) noexcept {
        return IrqResult{false, InterruptError{kind, cause}};
    }

    explicit operator bool() const noexcept { return ok; }
};

