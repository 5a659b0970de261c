#pragma once

#include "outcome_log.h"
#include "roll_config.h"

#include "dice/dice_arena.h"
#include "dice/roll_listener.h"
#include "dice/roll_resolver.h"
#include "dice/scenario_generator.h"
#include "physics/physics_world.h"
#include "playback/playback_interpolator.h"
#include "runtime/clock.h"

#include <memory>
#include <optional>
#include <string>

namespace App
{
    // ============================================================================
    // Simulation: owns the physics world, the arena, the resolver, the outcome
    // log and the playback interpolator for one dice tray.
    //
    // throw_dice() resolves synchronously, then starts a new playback session
    // that supersedes any previous one.
    // ============================================================================

    class Simulation final : public Dice::RollListener
    {
    public:
        // `world` must not be null. Scheduler, presenter and clock must outlive
        // the simulation.
        Simulation(std::unique_ptr<Physics::PhysicsWorld> world,
                   Playback::FrameScheduler &scheduler,
                   Playback::Presenter &presenter,
                   const Runtime::MonotonicClock &clock,
                   const RollConfig &config = {});
        ~Simulation() override = default;

        Simulation(const Simulation &) = delete;
        Simulation &operator=(const Simulation &) = delete;

        // Rebuilds dice when the count changes and resizes the arena.
        void apply_config(const RollConfig &config);
        const RollConfig &config() const { return _config; }

        void throw_dice(const std::optional<std::string> &seed);

        const OutcomeLog &outcome_log() const { return _log; }
        std::shared_ptr<const Dice::RollOutcome> last_outcome() const { return _last; }

        Playback::PlaybackInterpolator &playback() { return _playback; }
        const Playback::PlaybackInterpolator &playback() const { return _playback; }

        Physics::PhysicsWorld &world() { return *_world; }
        const Dice::DiceArena &arena() const { return _arena; }

        // Dice::RollListener
        void on_attempt_started(const std::string &seed, int attempt) override;
        void on_die_settled(size_t die_index, int face) override;
        void on_die_disturbed(size_t die_index) override;

    private:
        static Dice::DiceArena::Config arena_config(const RollConfig &config);
        static Dice::RollResolver::Config resolver_config(const RollConfig &config);
        Playback::PlaybackOptions playback_options() const;

        std::unique_ptr<Physics::PhysicsWorld> _world;
        RollConfig _config;

        Dice::DiceArena _arena;
        Dice::ScenarioGenerator _generator;
        Dice::RollResolver _resolver;
        Playback::PlaybackInterpolator _playback;

        OutcomeLog _log;
        std::shared_ptr<const Dice::RollOutcome> _last;
    };
} // namespace App
