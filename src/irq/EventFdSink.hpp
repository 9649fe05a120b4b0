#pragma once

#include "common/Types.hpp"
#include "irq/NotificationSink.hpp"

// ── eventfd notification sink ─────────────────────────────────────────────────
// Signals the guest through a Linux eventfd, the descriptor a KVM-style
// hypervisor binds to a guest interrupt line (irqfd).  Registering the fd with
// the hypervisor happens outside this library; fd() is exposed for that.
//
// eventfd semantics that matter here:
//   write(1)  adds 1 to the 64-bit counter and wakes any reader
//   read()    returns the counter and resets it to 0
// Several triggers before the consumer runs collapse into one wakeup, which
// matches the level-triggered InterruptStatus.
//
// Usage:
//   auto sink = std::make_shared<EventFdSink>();
//   if (auto ec = sink->open()) { ...fatal for the device... }
//   MmioIrq irq(sink);
class EventFdSink final : public NotificationSink {
public:
    EventFdSink() noexcept = default;
    ~EventFdSink() override;

    EventFdSink(EventFdSink&& other) noexcept;
    EventFdSink& operator=(EventFdSink&& other) noexcept;
    EventFdSink(const EventFdSink&)            = delete;
    EventFdSink& operator=(const EventFdSink&) = delete;

    // Create the eventfd (non-blocking, close-on-exec).  Closes any descriptor
    // already held.  Returns the errno cause on failure.
    [[nodiscard]] std::error_code open() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int  fd()      const noexcept { return fd_; }

    // EAGAIN (counter saturated) counts as delivered: the line is already
    // pending.  EINTR is retried.
    [[nodiscard]] std::error_code trigger() noexcept override;

    // ── Consumer side ─────────────────────────────────────────────────────────
    // Drain the counter.  Returns the number of triggers accumulated since the
    // last consume(), 0 if none are pending.
    [[nodiscard]] u64 consume() noexcept;

private:
    int fd_ = -1;

    void close() noexcept;
};

