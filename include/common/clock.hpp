#pragma once

#include <chrono>

// Time source for every polling loop, so loops can be driven without real delay.
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;
};
