#include "simulation.h"

#include "core/util/logger.h"

#include <utility>

namespace App
{
    namespace
    {
        RollConfig normalized(RollConfig config)
        {
            normalize_desired_rolls(config);
            return config;
        }
    } // namespace

    Simulation::Simulation(std::unique_ptr<Physics::PhysicsWorld> world,
                           Playback::FrameScheduler &scheduler,
                           Playback::Presenter &presenter,
                           const Runtime::MonotonicClock &clock,
                           const RollConfig &config)
        : _world(std::move(world))
        , _config(normalized(config))
        , _arena(*_world, arena_config(_config))
        , _resolver(*_world, _generator, clock, resolver_config(_config))
        , _playback(scheduler, presenter, clock)
    {
        _world->set_gravity(glm::vec3(0.0f, kGravityY, 0.0f));
        _generator.set_bounds(_arena.bounds());
        _arena.set_die_count(_config.number_of_dice);
    }

    void Simulation::apply_config(const RollConfig &config)
    {
        _config = normalized(config);

        _arena.resize(_config.arena_width, _config.arena_depth);
        _generator.set_bounds(_arena.bounds());
        _arena.set_die_count(_config.number_of_dice);
        _resolver.set_config(resolver_config(_config));
    }

    void Simulation::throw_dice(const std::optional<std::string> &seed)
    {
        _log.reset();

        _last = _resolver.resolve(_arena.die_bodies(), seed, this);
        if (_last->timed_out())
        {
            Logger::warn("Roll '{}' did not settle; unsettled dice show face {}", _last->seed, kFallbackFace);
        }

        _playback.start(_last, playback_options());
    }

    void Simulation::on_attempt_started(const std::string &seed, int attempt)
    {
        _log.reset();
        if (attempt > 0)
        {
            Logger::debug("Re-rolling with seed '{}' (attempt {})", seed, attempt + 1);
        }
    }

    void Simulation::on_die_settled(size_t die_index, int face)
    {
        Logger::debug("Die {} settled on {}", die_index, face);
        _log.append(die_index, face);
    }

    void Simulation::on_die_disturbed(size_t die_index)
    {
        Logger::debug("Die {} was knocked over", die_index);
        _log.withdraw(die_index);
    }

    Dice::DiceArena::Config Simulation::arena_config(const RollConfig &config)
    {
        Dice::DiceArena::Config ac{};
        ac.width = config.arena_width;
        ac.depth = config.arena_depth;
        return ac;
    }

    Dice::RollResolver::Config Simulation::resolver_config(const RollConfig &config)
    {
        Dice::RollResolver::Config rc{};
        rc.stuck_detection_steps = config.stuck_detection_steps;
        rc.max_retries = config.max_retries;
        rc.timeout_ms = config.timeout_ms;
        return rc;
    }

    Playback::PlaybackOptions Simulation::playback_options() const
    {
        Playback::PlaybackOptions options{};
        options.mode = _config.render_fixed_frames ? Playback::PlaybackMode::FixedFrame
                                                   : Playback::PlaybackMode::Interpolated;
        options.store_frames = _config.store_frames;
        options.magic = _config.magic;
        options.desired_faces = _config.desired_rolls;
        return options;
    }
} // namespace App
