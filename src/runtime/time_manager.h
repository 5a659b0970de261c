#pragma once

// TimeManager: paces the frame loop at a fixed display refresh rate and
// tracks frame timing.

#include "clock.h"

#include <cstdint>

namespace Runtime
{

class TimeManager
{
public:
    explicit TimeManager(const MonotonicClock& clock, double refresh_rate_hz = 60.0);

    // Begin a new frame. Call at the start of each frame.
    void begin_frame();

    // Block until the next refresh boundary. Returns immediately if the frame overran.
    void wait_for_next_frame();

    // Delta time in seconds since the last frame (clamped).
    float delta_time() const { return _delta_time; }

    // Total elapsed time in seconds since the first frame.
    double total_time() const { return _total_time; }

    double refresh_interval_ms() const { return _refresh_interval_ms; }

    // When off, wait_for_next_frame() returns immediately.
    void set_pacing(bool enabled) { _pacing = enabled; }
    bool pacing() const { return _pacing; }

    uint64_t frame_count() const { return _frame_count; }

private:
    const MonotonicClock& _clock;

    double _refresh_interval_ms{1000.0 / 60.0};
    double _frame_start_ms{0.0};
    double _last_frame_ms{0.0};

    float _delta_time{0.0f};
    double _total_time{0.0};
    bool _pacing{true};

    uint64_t _frame_count{0};

    static constexpr float k_max_delta_time = 0.1f; // 100ms cap
};

} // namespace Runtime
