#include "roll_resolver.h"
#include "face_classifier.h"

#include "core/util/logger.h"

#include <glm/geometric.hpp>

#include <algorithm>

namespace Dice
{
    const char *resolve_state_name(ResolveState state)
    {
        switch (state)
        {
            case ResolveState::Running: return "running";
            case ResolveState::Settled: return "settled";
            case ResolveState::TimedOut: return "timed out";
            case ResolveState::Retrying: return "retrying";
        }
        return "unknown";
    }

    RollResolver::RollResolver(Physics::PhysicsWorld &world, const ScenarioGenerator &generator,
                               const Runtime::MonotonicClock &clock)
        : RollResolver(world, generator, clock, Config{})
    {
    }

    RollResolver::RollResolver(Physics::PhysicsWorld &world, const ScenarioGenerator &generator,
                               const Runtime::MonotonicClock &clock, const Config &config)
        : _world(world), _generator(generator), _clock(clock), _config(config)
    {
    }

    std::shared_ptr<const RollOutcome> RollResolver::resolve(const std::vector<Physics::BodyId> &dice,
                                                             const std::optional<std::string> &seed,
                                                             RollListener *listener)
    {
        const double started_ms = _clock.now_ms();
        const int die_count = static_cast<int>(dice.size());

        auto outcome = std::make_shared<RollOutcome>();
        std::string attempt_seed = seed.has_value() ? *seed : make_random_seed();

        AttemptResult result = AttemptResult::Settled;
        for (int attempt = 0;; ++attempt)
        {
            _state = ResolveState::Running;
            outcome->seed = attempt_seed;
            outcome->retries = attempt;
            outcome->trajectory.clear();
            outcome->face_values.assign(dice.size(), _config.fallback_face);

            if (listener)
            {
                listener->on_attempt_started(attempt_seed, attempt);
            }

            reset_bodies(dice);
            apply_scenario(dice, _generator.generate(attempt_seed, die_count));

            result = run_attempt(dice, *outcome, listener);
            if (result != AttemptResult::Stuck)
            {
                break;
            }

            if (attempt >= _config.max_retries)
            {
                Logger::error("[RollResolver] Roll '{}' still stuck after {} retries; using fallback faces",
                              attempt_seed, attempt);
                result = AttemptResult::TimedOut;
                break;
            }

            detach_watchers();
            _state = ResolveState::Retrying;
            std::string next_seed = make_random_seed();
            Logger::warn("[RollResolver] Roll '{}' stuck after {} steps, retrying with seed '{}' ({}/{})",
                         attempt_seed, outcome->steps, next_seed, attempt + 1, _config.max_retries);
            attempt_seed = std::move(next_seed);
        }

        outcome->trajectory.append(capture_frame(dice));

        for (size_t d = 0; d < _watchers.size(); ++d)
        {
            outcome->face_values[d] = _watchers[d].is_settled() ? _watchers[d].face() : _config.fallback_face;
        }
        detach_watchers();

        _state = result == AttemptResult::Settled ? ResolveState::Settled : ResolveState::TimedOut;
        outcome->state = _state;
        outcome->elapsed_ms = _clock.now_ms() - started_ms;
        outcome->trajectory.freeze();

        Logger::info("[RollResolver] Simulation took {:.3f} s ({} steps, {} retries, seed '{}', {})",
                     outcome->elapsed_ms / 1000.0, outcome->steps, outcome->retries, outcome->seed,
                     resolve_state_name(_state));

        const Physics::PhysicsWorld::DebugStats stats = _world.debug_stats();
        Logger::debug("[RollResolver] avg step {:.3f} ms, {} bodies ({} active)", stats.avg_step_ms,
                      stats.body_count, stats.active_body_count);

        return outcome;
    }

    void RollResolver::reset_bodies(const std::vector<Physics::BodyId> &dice)
    {
        detach_watchers();
        for (Physics::BodyId id : dice)
        {
            _world.set_linear_velocity(id, glm::vec3(0.0f));
            _world.set_angular_velocity(id, glm::vec3(0.0f));
            _world.set_allow_sleeping(id, true);
        }
    }

    void RollResolver::apply_scenario(const std::vector<Physics::BodyId> &dice, const Scenario &scenario)
    {
        _watchers.clear();
        _watchers.reserve(dice.size());

        for (size_t d = 0; d < dice.size(); ++d)
        {
            const DieLaunch &launch = scenario.dice[d];
            _world.set_transform(dice[d], launch.position, launch.orientation);
            _world.add_impulse(dice[d], launch.impulse, launch.position + launch.impulse_offset);

            _watchers.emplace_back(dice[d]);
            _watchers.back().arm();
        }
    }

    void RollResolver::detach_watchers()
    {
        for (SettleWatcher &w : _watchers)
        {
            w.detach();
        }
    }

    RollResolver::AttemptResult RollResolver::run_attempt(const std::vector<Physics::BodyId> &dice,
                                                          RollOutcome &outcome, RollListener *listener)
    {
        const double deadline_ms = _clock.now_ms() + _config.timeout_ms;
        std::vector<std::optional<MotionSample>> previous(dice.size());

        auto has_unsettled = [this]() {
            return std::any_of(_watchers.begin(), _watchers.end(),
                               [](const SettleWatcher &w) { return !w.is_settled(); });
        };

        size_t step = 0;
        outcome.steps = 0;
        while (has_unsettled())
        {
            outcome.trajectory.append(capture_frame(dice));
            _world.step(_config.timestep);
            outcome.steps = ++step;

            for (size_t d = 0; d < _watchers.size(); ++d)
            {
                switch (_watchers[d].poll(_world, _config.face_epsilon))
                {
                    case WatchEvent::Settled:
                        outcome.face_values[d] = _watchers[d].face();
                        if (listener)
                        {
                            listener->on_die_settled(d, _watchers[d].face());
                        }
                        break;
                    case WatchEvent::Disturbed:
                        Logger::debug("[RollResolver] Die {} knocked off face {} at step {}", d,
                                      outcome.face_values[d], step);
                        outcome.face_values[d] = _config.fallback_face;
                        if (listener)
                        {
                            listener->on_die_disturbed(d);
                        }
                        break;
                    case WatchEvent::None:
                        break;
                }
            }

            if (!has_unsettled())
            {
                break;
            }

            if (_config.stuck_detection_steps > 0 &&
                step % static_cast<size_t>(_config.stuck_detection_steps) == 0 &&
                is_stuck(dice, previous))
            {
                return AttemptResult::Stuck;
            }

            if (_clock.now_ms() >= deadline_ms)
            {
                Logger::error("[RollResolver] Roll '{}' timed out after {:.0f} ms ({} steps)",
                              outcome.seed, _config.timeout_ms, step);
                return AttemptResult::TimedOut;
            }
        }

        return AttemptResult::Settled;
    }

    TrajectoryFrame RollResolver::capture_frame(const std::vector<Physics::BodyId> &dice) const
    {
        TrajectoryFrame frame;
        frame.reserve(dice.size());
        for (Physics::BodyId id : dice)
        {
            const Physics::BodyTransform xf = _world.get_transform(id);
            frame.push_back(DiePose{xf.position, xf.rotation});
        }
        return frame;
    }

    bool RollResolver::is_stuck(const std::vector<Physics::BodyId> &dice,
                                std::vector<std::optional<MotionSample>> &previous) const
    {
        bool still = true;
        bool any_unsettled = false;

        for (size_t d = 0; d < dice.size() && d < _watchers.size(); ++d)
        {
            if (_watchers[d].is_settled())
            {
                continue;
            }
            any_unsettled = true;

            const Physics::BodyMotion motion = _world.get_motion(dice[d]);
            MotionSample current{};
            current.position = motion.position;
            current.linear_speed = glm::length(motion.linear_velocity);
            current.angular_speed = glm::length(motion.angular_velocity);

            if (!previous[d].has_value())
            {
                still = false;
            }
            else
            {
                const float moved = glm::distance(current.position, previous[d]->position);
                if (moved >= _config.stuck_threshold ||
                    current.linear_speed >= _config.stuck_threshold ||
                    current.angular_speed >= _config.stuck_threshold)
                {
                    still = false;
                }
            }
            previous[d] = current;
        }

        return any_unsettled && still;
    }
} // namespace Dice
