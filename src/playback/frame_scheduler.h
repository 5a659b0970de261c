#pragma once

#include <functional>

namespace Playback
{
    // Display-refresh scheduler: runs a callback on the next refresh.
    // Scheduled callbacks cannot be cancelled; callers check a token instead.
    class FrameScheduler
    {
    public:
        using Callback = std::function<void()>;

        virtual ~FrameScheduler() = default;

        virtual void schedule_next(Callback callback) = 0;
    };
} // namespace Playback
