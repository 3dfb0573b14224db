#include "platform/linux/timerfd_ticker.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/timerfd.h>
#include <unistd.h>

TimerfdTicker::TimerfdTicker() {
    fd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd_ < 0) {
        std::println(stderr, "ticker: timerfd_create failed: {}", std::strerror(errno));
    }
}

TimerfdTicker::~TimerfdTicker() {
    if (fd_ >= 0) ::close(fd_);
}

bool TimerfdTicker::arm(std::chrono::milliseconds period) {
    if (fd_ < 0 || period.count() <= 0) return false;

    auto secs = std::chrono::duration_cast<std::chrono::seconds>(period);
    auto nsecs = std::chrono::duration_cast<std::chrono::nanoseconds>(period - secs);

    itimerspec spec{};
    spec.it_interval.tv_sec = static_cast<time_t>(secs.count());
    spec.it_interval.tv_nsec = static_cast<long>(nsecs.count());
    spec.it_value = spec.it_interval;

    if (::timerfd_settime(fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "ticker: timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }
    armed_ = true;
    return true;
}

void TimerfdTicker::disarm() {
    if (fd_ < 0 || !armed_) return;

    itimerspec spec{};
    if (::timerfd_settime(fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "ticker: disarm failed: {}", std::strerror(errno));
    }
    armed_ = false;
    consume();
}

uint64_t TimerfdTicker::consume() {
    uint64_t expirations = 0;
    if (::read(fd_, &expirations, sizeof(expirations)) != sizeof(expirations)) {
        return 0;
    }
    return expirations;
}
