#include "frame_loop.h"

#include <utility>

namespace Runtime
{
    FrameLoop::FrameLoop(const MonotonicClock &clock, double refresh_rate_hz)
        : _time(clock, refresh_rate_hz)
    {
    }

    void FrameLoop::schedule_next(Callback callback)
    {
        if (callback)
        {
            _pending.push_back(std::move(callback));
        }
    }

    void FrameLoop::run_frame()
    {
        _time.begin_frame();

        // Callbacks may schedule again; those land in the next frame.
        std::vector<Callback> current;
        current.swap(_pending);
        for (Callback &cb : current)
        {
            cb();
        }
    }

    uint64_t FrameLoop::run_until_idle(uint64_t max_frames)
    {
        _quit_requested = false;

        uint64_t frames = 0;
        while (!_pending.empty() && !_quit_requested)
        {
            if (max_frames != 0 && frames >= max_frames)
            {
                break;
            }

            run_frame();
            ++frames;

            if (!_pending.empty())
            {
                _time.wait_for_next_frame();
            }
        }
        return frames;
    }
} // namespace Runtime
