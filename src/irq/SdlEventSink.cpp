#include "SdlEventSink.hpp"

#include <array>
#include <cstdio>

SdlEventSink::SdlEventSink(s32 device_id) noexcept
    : device_id_(device_id)
{
    // Reference counted by SDL: each sink takes and releases its own hold on
    // the events subsystem.
    if (SDL_InitSubSystem(SDL_INIT_EVENTS) != 0) {
        std::fprintf(stderr, "[SDL] SDL_InitSubSystem(EVENTS) failed: %s\n", SDL_GetError());
        return;
    }

    event_type_ = SDL_RegisterEvents(1);
    if (event_type_ == static_cast<u32>(-1)) {
        std::fprintf(stderr, "[SDL] SDL_RegisterEvents failed: out of user event types\n");
        SDL_QuitSubSystem(SDL_INIT_EVENTS);
        return;
    }
    ready_ = true;
}

SdlEventSink::~SdlEventSink() {
    if (ready_) SDL_QuitSubSystem(SDL_INIT_EVENTS);
}

std::error_code SdlEventSink::trigger() noexcept {
    if (!ready_) {
        return std::make_error_code(std::errc::no_such_device);
    }

    SDL_Event ev{};
    ev.type       = event_type_;
    ev.user.code  = device_id_;
    ev.user.data1 = nullptr;
    ev.user.data2 = nullptr;

    const int rc = SDL_PushEvent(&ev);
    if (rc == 1) return {};
    if (rc == 0) {
        // An event filter swallowed it.
        return std::make_error_code(std::errc::operation_canceled);
    }
    std::fprintf(stderr, "[SDL] SDL_PushEvent failed: %s\n", SDL_GetError());
    return std::make_error_code(std::errc::io_error);
}

int SdlEventSink::wait(int timeout_ms) noexcept {
    if (!ready_) return 0;

    // Filtered peek instead of SDL_WaitEventTimeout: events that belong to
    // other sinks (or the front end) must stay in the queue.  PeepEvents does
    // not pump, so pump here or SIGINT never turns into SDL_QUIT.
    const u32 deadline = SDL_GetTicks() + static_cast<u32>(timeout_ms);
    for (;;) {
        SDL_PumpEvents();
        const int n = drain();
        if (n > 0) return n;
        if (SDL_HasEvent(SDL_QUIT) == SDL_TRUE) return -1;
        // SDL_TICKS_PASSED handles the 49-day wrap of SDL_GetTicks.
        if (SDL_TICKS_PASSED(SDL_GetTicks(), deadline)) return 0;
        SDL_Delay(1);
    }
}

int SdlEventSink::drain() noexcept {
    std::array<SDL_Event, 64> batch;
    int total = 0;
    for (;;) {
        const int n = SDL_PeepEvents(batch.data(), static_cast<int>(batch.size()),
                                     SDL_GETEVENT, event_type_, event_type_);
        if (n <= 0) return total;
        total += n;
    }
}

