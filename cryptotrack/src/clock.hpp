#pragma once

#include "cancel_token.hpp"
#include <chrono>

class Clock {
public:
    virtual ~Clock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;

    // Blocks for `duration` or until `cancel` is set, whichever comes first.
    virtual void sleep_for(std::chrono::seconds duration, const CancelToken& cancel) = 0;
};

class SystemClock : public Clock {
public:
    explicit SystemClock(std::chrono::milliseconds slice = std::chrono::milliseconds(100));

    std::chrono::system_clock::time_point now() const override;
    void sleep_for(std::chrono::seconds duration, const CancelToken& cancel) override;

private:
    std::chrono::milliseconds slice_;
};
