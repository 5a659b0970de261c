#include "time_manager.h"

#include <algorithm>
#include <chrono>
#include <thread>

namespace Runtime
{
    TimeManager::TimeManager(const MonotonicClock& clock, double refresh_rate_hz)
        : _clock(clock)
        , _refresh_interval_ms(1000.0 / std::clamp(refresh_rate_hz, 1.0, 1000.0))
    {
        _frame_start_ms = _clock.now_ms();
        _last_frame_ms = _frame_start_ms;
    }

    void TimeManager::begin_frame()
    {
        const double now = _clock.now_ms();
        const double elapsed_s = (now - _last_frame_ms) / 1000.0;
        _last_frame_ms = now;
        _frame_start_ms = now;

        // Clamp delta time so a stall does not show up as one huge frame
        _delta_time = std::min(static_cast<float>(elapsed_s), k_max_delta_time);
        if (_frame_count > 0)
        {
            _total_time += elapsed_s;
        }

        ++_frame_count;
    }

    void TimeManager::wait_for_next_frame()
    {
        if (!_pacing)
        {
            return;
        }

        const double remaining = _frame_start_ms + _refresh_interval_ms - _clock.now_ms();
        if (remaining > 0.0)
        {
            std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(remaining));
        }
    }
} // namespace Runtime
