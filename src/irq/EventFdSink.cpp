#include "EventFdSink.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>
#include <sys/eventfd.h>
#include <unistd.h>

EventFdSink::~EventFdSink() {
    close();
}

EventFdSink::EventFdSink(EventFdSink&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
{}

EventFdSink& EventFdSink::operator=(EventFdSink&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

std::error_code EventFdSink::open() noexcept {
    close();
    fd_ = ::eventfd(0u, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd_ < 0) {
        const int err = errno;
        std::fprintf(stderr, "[EventFd] eventfd() failed: %s\n", std::strerror(err));
        return {err, std::system_category()};
    }
    return {};
}

std::error_code EventFdSink::trigger() noexcept {
    if (fd_ < 0) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }

    const u64 one = 1u;
    for (;;) {
        const ssize_t n = ::write(fd_, &one, sizeof(one));
        if (n == static_cast<ssize_t>(sizeof(one))) return {};
        if (n < 0 && errno == EINTR) continue;
        // Counter at its maximum: an interrupt is pending already.
        if (n < 0 && errno == EAGAIN) return {};
        if (n < 0) return {errno, std::system_category()};
        // eventfd writes are all-or-nothing; a short write means the fd is
        // not what we think it is.
        return std::make_error_code(std::errc::io_error);
    }
}

u64 EventFdSink::consume() noexcept {
    if (fd_ < 0) return 0u;

    u64 count = 0u;
    for (;;) {
        const ssize_t n = ::read(fd_, &count, sizeof(count));
        if (n == static_cast<ssize_t>(sizeof(count))) return count;
        if (n < 0 && errno == EINTR) continue;
        return 0u;   // EAGAIN: nothing pending
    }
}

void EventFdSink::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

