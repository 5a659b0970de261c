#pragma once

#include "core/config.h"
#include "physics/physics_world.h"
#include "roll_listener.h"
#include "roll_outcome.h"
#include "runtime/clock.h"
#include "scenario_generator.h"
#include "settle_watcher.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Dice
{
    // ============================================================================
    // RollResolver: steps the world at a fixed rate until every die is at rest.
    //
    //   Running -> Settled | TimedOut | Retrying -> Running
    //
    // Each iteration records a frame, steps once, then polls the watchers.
    // Every stuck_detection_steps iterations the unsettled dice are sampled; two
    // consecutive samples without movement restart the roll with a fresh seed,
    // at most max_retries times. The wall-clock deadline ends the roll with the
    // fallback face for every die still moving.
    // ============================================================================

    class RollResolver
    {
    public:
        struct Config
        {
            float timestep{kSimulationTimestep};
            int stuck_detection_steps{kStuckDetectionSteps};
            float stuck_threshold{kStuckThreshold};
            int max_retries{kMaxRetries};
            double timeout_ms{kResolveTimeoutMs};
            int fallback_face{kFallbackFace};
            double face_epsilon{kFaceEpsilon};
        };

        RollResolver(Physics::PhysicsWorld &world, const ScenarioGenerator &generator,
                     const Runtime::MonotonicClock &clock);
        RollResolver(Physics::PhysicsWorld &world, const ScenarioGenerator &generator,
                     const Runtime::MonotonicClock &clock, const Config &config);

        // Runs to completion. Never returns null.
        std::shared_ptr<const RollOutcome> resolve(const std::vector<Physics::BodyId> &dice,
                                                   const std::optional<std::string> &seed,
                                                   RollListener *listener = nullptr);

        const Config &config() const { return _config; }
        void set_config(const Config &config) { _config = config; }

        ResolveState state() const { return _state; }
        const std::vector<SettleWatcher> &watchers() const { return _watchers; }

    private:
        enum class AttemptResult
        {
            Settled,
            Stuck,
            TimedOut
        };

        struct MotionSample
        {
            glm::vec3 position{0.0f};
            float linear_speed{0.0f};
            float angular_speed{0.0f};
        };

        void reset_bodies(const std::vector<Physics::BodyId> &dice);
        void apply_scenario(const std::vector<Physics::BodyId> &dice, const Scenario &scenario);
        void detach_watchers();

        AttemptResult run_attempt(const std::vector<Physics::BodyId> &dice, RollOutcome &outcome,
                                  RollListener *listener);

        TrajectoryFrame capture_frame(const std::vector<Physics::BodyId> &dice) const;

        // True when every unsettled die is still relative to the previous sample.
        bool is_stuck(const std::vector<Physics::BodyId> &dice,
                      std::vector<std::optional<MotionSample>> &previous) const;

        Physics::PhysicsWorld &_world;
        const ScenarioGenerator &_generator;
        const Runtime::MonotonicClock &_clock;
        Config _config;

        std::vector<SettleWatcher> _watchers;
        ResolveState _state{ResolveState::Settled};
    };
} // namespace Dice
