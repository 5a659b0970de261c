#pragma once

#include "dice/roll_outcome.h"
#include "frame_scheduler.h"
#include "presenter.h"
#include "runtime/clock.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Playback
{
    enum class PlaybackMode
    {
        Interpolated, // follows wall-clock time, one sim step per 1/60 s
        FixedFrame    // one recorded step per refresh
    };

    using GenerationToken = uint64_t;

    struct FrameExport
    {
        std::string frame;
        std::optional<double> duration_ms;
    };

    struct PlaybackOptions
    {
        PlaybackMode mode{PlaybackMode::Interpolated};
        bool store_frames{false};

        // Outcome correction of the displayed poses
        bool magic{false};
        std::vector<int> desired_faces;
    };

    // ============================================================================
    // PlaybackInterpolator: replays a frozen trajectory through the presenter.
    //
    // start() bumps the generation token; a scheduled callback carrying an older
    // token does nothing at all. The first frame is drawn synchronously inside
    // start(). The terminal frame ends the session and is not rescheduled.
    // ============================================================================

    class PlaybackInterpolator
    {
    public:
        PlaybackInterpolator(FrameScheduler &scheduler, Presenter &presenter, const Runtime::MonotonicClock &clock);

        GenerationToken start(std::shared_ptr<const Dice::RollOutcome> outcome, const PlaybackOptions &options);

        // Supersedes the current session without starting another.
        void cancel();

        GenerationToken current_token() const { return _token; }
        bool is_current(GenerationToken token) const { return token == _token; }
        bool is_playing() const { return _session.has_value(); }

        // Export buffer of the latest session.
        const std::vector<FrameExport> &exported_frames() const { return _exports; }

        // Fractional simulation step of the last interpolated frame.
        double last_step_index() const { return _last_step_index; }
        uint64_t frames_presented() const { return _frames_presented; }

        // s = elapsed_seconds * simulation rate
        static double step_index_at(double elapsed_ms);

        // Pose set at fractional step s. `terminal` is set when s is past the
        // last recorded step (the result is then the last frame exactly).
        static Dice::TrajectoryFrame sample(const Dice::TrajectoryRecord &trajectory, double step_index,
                                            bool &terminal);

    private:
        struct Session
        {
            std::shared_ptr<const Dice::RollOutcome> outcome;
            PlaybackOptions options;
            GenerationToken token{0};
            double start_ms{0.0};
            double last_frame_ms{0.0};
            size_t frame_index{0};
        };

        void on_frame(GenerationToken token);
        void apply_magic(const Session &session, Dice::TrajectoryFrame &poses) const;
        void store_frame(Session &session, double now_ms);
        void finish(Session &session);

        FrameScheduler &_scheduler;
        Presenter &_presenter;
        const Runtime::MonotonicClock &_clock;

        std::optional<Session> _session;
        GenerationToken _token{0};

        std::vector<FrameExport> _exports;
        double _last_step_index{0.0};
        uint64_t _frames_presented{0};
    };
} // namespace Playback
