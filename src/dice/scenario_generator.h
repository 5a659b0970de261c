#pragma once

#include "core/config.h"
#include "seeded_random.h"

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include <optional>
#include <string>
#include <vector>

namespace Dice
{
    // Launch state of one die.
    struct DieLaunch
    {
        glm::vec3 position{0.0f};
        glm::quat orientation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 impulse{0.0f};
        glm::vec3 impulse_offset{0.0f}; // from the center of mass, world axes
    };

    struct Scenario
    {
        std::string seed;
        std::vector<DieLaunch> dice;
        bool grid_fallback{false};
    };

    struct ArenaBounds
    {
        float half_width{kArenaWidth * 0.5f};
        float half_depth{kArenaDepth * 0.5f};
        float floor_y{kFloorY};
    };

    // ============================================================================
    // ScenarioGenerator: seed + die count -> start poses and launch impulses.
    //
    // Draw order from the seeded stream is fixed: every start position first
    // (x, z, y per attempt), then per die three Euler angles, impulse
    // magnitude and launch direction. Same seed and count => same scenario.
    // ============================================================================

    class ScenarioGenerator
    {
    public:
        struct Config
        {
            ArenaBounds bounds{};
            float start_height{kStartHeight};
            float start_height_jitter{kStartHeightJitter};
            float margin{kPlacementMargin};
            float min_separation{kMinDieSeparation};
            int max_attempts{kMaxPlacementAttempts};
            float impulse_min{kImpulseMin};
            float impulse_range{kImpulseRange};
            glm::vec3 impulse_offset{0.0f, 0.0f, kImpulseOffsetZ};
        };

        ScenarioGenerator() = default;
        explicit ScenarioGenerator(const Config &config) : _config(config)
        {
        }

        // Absent seed => make_random_seed(). The seed used is stored in the result.
        Scenario generate(const std::optional<std::string> &seed, int die_count) const;

        const Config &config() const { return _config; }
        void set_bounds(const ArenaBounds &bounds) { _config.bounds = bounds; }

        // Rejection-sampled positions; falls back to grid_positions() for the
        // whole set when any die runs out of attempts.
        static std::vector<glm::vec3> place_dice(int die_count, SeededRandom &rng, const Config &config,
                                                 bool *used_grid = nullptr);

        // Centered grid inside the usable footprint at the start height.
        static std::vector<glm::vec3> grid_positions(int die_count, const Config &config);

    private:
        Config _config{};
    };
} // namespace Dice
