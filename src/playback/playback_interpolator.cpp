#include "playback_interpolator.h"

#include "core/config.h"
#include "core/util/logger.h"
#include "dice/outcome_corrector.h"

#include <glm/common.hpp>
#include <glm/gtc/quaternion.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace Playback
{
    PlaybackInterpolator::PlaybackInterpolator(FrameScheduler &scheduler, Presenter &presenter,
                                               const Runtime::MonotonicClock &clock)
        : _scheduler(scheduler), _presenter(presenter), _clock(clock)
    {
    }

    GenerationToken PlaybackInterpolator::start(std::shared_ptr<const Dice::RollOutcome> outcome,
                                                const PlaybackOptions &options)
    {
        ++_token;
        _exports.clear();
        _last_step_index = 0.0;
        _session.reset();

        if (!outcome)
        {
            Logger::warn("[Playback] start() without an outcome");
            return _token;
        }

        Session session{};
        session.outcome = std::move(outcome);
        session.options = options;
        session.token = _token;
        session.start_ms = _clock.now_ms();
        session.last_frame_ms = session.start_ms;
        _session = std::move(session);

        on_frame(_token);
        return _token;
    }

    void PlaybackInterpolator::cancel()
    {
        ++_token;
        _session.reset();
    }

    double PlaybackInterpolator::step_index_at(double elapsed_ms)
    {
        return std::max(elapsed_ms, 0.0) / 1000.0 * kSimulationRateHz;
    }

    Dice::TrajectoryFrame PlaybackInterpolator::sample(const Dice::TrajectoryRecord &trajectory, double step_index,
                                                       bool &terminal)
    {
        terminal = false;
        if (trajectory.empty())
        {
            terminal = true;
            return {};
        }

        const double s = std::max(step_index, 0.0);
        const size_t last = trajectory.last_index();
        const size_t i = std::min(static_cast<size_t>(std::floor(s)), last);
        const double j = std::ceil(s);

        if (j > static_cast<double>(last))
        {
            terminal = true;
            return trajectory[i];
        }

        const Dice::TrajectoryFrame &from = trajectory[i];
        const Dice::TrajectoryFrame &to = trajectory[static_cast<size_t>(j)];
        const float t = static_cast<float>(s - static_cast<double>(i));

        Dice::TrajectoryFrame out(from.size());
        for (size_t d = 0; d < from.size(); ++d)
        {
            out[d].position = glm::mix(from[d].position, to[d].position, t);
            out[d].orientation = glm::slerp(from[d].orientation, to[d].orientation, t);
        }
        return out;
    }

    void PlaybackInterpolator::on_frame(GenerationToken token)
    {
        // Superseded session: no render, no export, no reschedule.
        if (!is_current(token) || !_session)
        {
            return;
        }

        Session &session = *_session;
        const Dice::TrajectoryRecord &trajectory = session.outcome->trajectory;
        if (trajectory.empty())
        {
            finish(session);
            return;
        }

        const double now_ms = _clock.now_ms();
        Dice::TrajectoryFrame poses;
        bool terminal = false;

        if (session.options.mode == PlaybackMode::FixedFrame)
        {
            const size_t index = std::min(session.frame_index, trajectory.last_index());
            poses = trajectory[index];
            terminal = index >= trajectory.last_index();
            ++session.frame_index;
        }
        else
        {
            _last_step_index = step_index_at(now_ms - session.start_ms);
            poses = sample(trajectory, _last_step_index, terminal);
        }

        if (session.options.magic)
        {
            apply_magic(session, poses);
        }

        _presenter.present(poses);
        ++_frames_presented;

        if (session.options.store_frames)
        {
            store_frame(session, now_ms);
        }
        session.last_frame_ms = now_ms;

        if (terminal)
        {
            finish(session);
            return;
        }

        _scheduler.schedule_next([this, token]() { on_frame(token); });
    }

    void PlaybackInterpolator::apply_magic(const Session &session, Dice::TrajectoryFrame &poses) const
    {
        const std::vector<int> &actual = session.outcome->face_values;
        const std::vector<int> &desired = session.options.desired_faces;

        const size_t count = std::min({poses.size(), actual.size(), desired.size()});
        for (size_t d = 0; d < count; ++d)
        {
            poses[d].orientation = Dice::apply_correction(poses[d].orientation, actual[d], desired[d]);
        }
    }

    void PlaybackInterpolator::store_frame(Session &session, double now_ms)
    {
        FrameExport entry{};
        entry.frame = _presenter.capture_frame();

        if (session.options.mode == PlaybackMode::FixedFrame)
        {
            entry.duration_ms = 1000.0 / kSimulationRateHz;
        }
        else if (!_exports.empty())
        {
            _exports.back().duration_ms = now_ms - session.last_frame_ms;
        }

        _exports.push_back(std::move(entry));
    }

    void PlaybackInterpolator::finish(Session &session)
    {
        if (session.options.store_frames)
        {
            Logger::info("[Playback] Stored {} frames", _exports.size());
        }
        _session.reset();
    }
} // namespace Playback
