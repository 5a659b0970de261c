#pragma once

// MonotonicClock: source of "now" for deadlines and playback timing.
// Injected so tests can drive time by hand.

#include <chrono>

namespace Runtime
{

class MonotonicClock
{
public:
    virtual ~MonotonicClock() = default;

    // Milliseconds since an arbitrary fixed origin. Never decreases.
    virtual double now_ms() const = 0;
};

class SteadyClock final : public MonotonicClock
{
public:
    SteadyClock() : _origin(Clock::now()) {}

    double now_ms() const override
    {
        return std::chrono::duration<double, std::milli>(Clock::now() - _origin).count();
    }

private:
    using Clock = std::chrono::steady_clock;
    Clock::time_point _origin;
};

} // namespace Runtime
