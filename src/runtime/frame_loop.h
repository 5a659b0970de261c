#pragma once

// FrameLoop: display-refresh loop for headless playback.
// Callbacks scheduled during frame N run in frame N+1; the loop idles once
// nothing is scheduled.

#include "playback/frame_scheduler.h"
#include "time_manager.h"

#include <cstdint>
#include <vector>

namespace Runtime
{

class FrameLoop final : public Playback::FrameScheduler
{
public:
    explicit FrameLoop(const MonotonicClock& clock, double refresh_rate_hz = 60.0);

    // Non-copyable
    FrameLoop(const FrameLoop&) = delete;
    FrameLoop& operator=(const FrameLoop&) = delete;

    // Playback::FrameScheduler
    void schedule_next(Callback callback) override;

    // Run frames until no callback is pending, quit is requested or
    // max_frames have run (0 = unlimited). Returns the number of frames run.
    uint64_t run_until_idle(uint64_t max_frames = 0);

    // Run exactly one frame: every callback scheduled before this call.
    void run_frame();

    bool idle() const { return _pending.empty(); }
    size_t pending() const { return _pending.size(); }

    // Request quit (loop will exit after the current frame)
    void request_quit() { _quit_requested = true; }
    bool quit_requested() const { return _quit_requested; }

    TimeManager& time() { return _time; }
    const TimeManager& time() const { return _time; }

private:
    TimeManager _time;
    std::vector<Callback> _pending;
    bool _quit_requested{false};
};

} // namespace Runtime
