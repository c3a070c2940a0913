#include "clock.hpp"
#include <algorithm>
#include <thread>

SystemClock::SystemClock(std::chrono::milliseconds slice) : slice_(slice) {}

std::chrono::system_clock::time_point SystemClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(std::chrono::seconds duration, const CancelToken& cancel) {
    auto deadline = std::chrono::steady_clock::now() + duration;

    while (!cancel.is_cancelled()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) break;
        std::this_thread::sleep_for(std::min(remaining, slice_));
    }
}
