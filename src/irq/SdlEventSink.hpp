#pragma once

#include <SDL2/SDL.h>
#include "common/Types.hpp"
#include "irq/NotificationSink.hpp"

// ── SDL event-queue notification sink ─────────────────────────────────────────
// Uses the SDL event queue as the interrupt line for a user-space front end:
// trigger() pushes one user event of a privately registered type, and the
// thread playing the guest driver waits on the queue with wait().
//
// SDL_PushEvent is safe to call from any thread, which is all trigger() needs.
// Only the events subsystem is initialised; no window or video driver.
//
//   user.type   event_type()
//   user.code   device id passed at construction
//
// Usage:
//   auto sink = std::make_shared<SdlEventSink>(device_id);
//   if (!sink->ready()) { ...SDL unavailable... }
//   MmioIrq irq(sink);
//   ...
//   while (sink->wait(100) > 0) { read InterruptStatus, ack }
class SdlEventSink final : public NotificationSink {
public:
    explicit SdlEventSink(s32 device_id = 0) noexcept;
    ~SdlEventSink() override;

    SdlEventSink(const SdlEventSink&)            = delete;
    SdlEventSink& operator=(const SdlEventSink&) = delete;

    [[nodiscard]] bool ready()      const noexcept { return ready_; }
    [[nodiscard]] u32  event_type() const noexcept { return event_type_; }
    [[nodiscard]] s32  device_id()  const noexcept { return device_id_; }

    [[nodiscard]] std::error_code trigger() noexcept override;

    // ── Consumer side ─────────────────────────────────────────────────────────
    // Block up to `timeout_ms` for the first notification, then drain any that
    // queued up behind it.  Returns the number drained (0 on timeout), or -1
    // once SDL_QUIT is queued.  Events of other types are left in the queue.
    // Pumps the event loop, so call it from the thread that initialised SDL.
    [[nodiscard]] int wait(int timeout_ms) noexcept;

private:
    s32  device_id_  = 0;
    u32  event_type_ = static_cast<u32>(-1);   // SDL_RegisterEvents failure value
    bool ready_      = false;

    [[nodiscard]] int drain() noexcept;
};

