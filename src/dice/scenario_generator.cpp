#include "scenario_generator.h"

#include "core/util/logger.h"

#include <glm/geometric.hpp>
#include <glm/gtc/constants.hpp>

#include <algorithm>
#include <cmath>

namespace Dice
{
    namespace
    {
        float usable_half(float half_extent, float margin)
        {
            return std::max(half_extent - margin, 0.0f);
        }

        // Intrinsic X-Y-Z Euler angles.
        glm::quat euler_xyz(float ax, float ay, float az)
        {
            const glm::quat qx = glm::angleAxis(ax, glm::vec3(1.0f, 0.0f, 0.0f));
            const glm::quat qy = glm::angleAxis(ay, glm::vec3(0.0f, 1.0f, 0.0f));
            const glm::quat qz = glm::angleAxis(az, glm::vec3(0.0f, 0.0f, 1.0f));
            return glm::normalize(qx * qy * qz);
        }
    } // namespace

    Scenario ScenarioGenerator::generate(const std::optional<std::string> &seed, int die_count) const
    {
        Scenario scenario{};
        scenario.seed = seed.has_value() ? *seed : make_random_seed();

        const int count = std::max(die_count, 0);
        SeededRandom rng(scenario.seed);

        std::vector<glm::vec3> positions = place_dice(count, rng, _config, &scenario.grid_fallback);
        if (scenario.grid_fallback)
        {
            Logger::debug("Scenario '{}': placement fell back to a grid for {} dice", scenario.seed, count);
        }

        constexpr float kTwoPi = glm::two_pi<float>();
        scenario.dice.reserve(count);
        for (int i = 0; i < count; ++i)
        {
            DieLaunch launch{};
            launch.position = positions[i];

            const float ax = kTwoPi * static_cast<float>(rng.next_unit());
            const float ay = kTwoPi * static_cast<float>(rng.next_unit());
            const float az = kTwoPi * static_cast<float>(rng.next_unit());
            launch.orientation = euler_xyz(ax, ay, az);

            const float force = _config.impulse_min + _config.impulse_range * static_cast<float>(rng.next_unit());
            const float theta = kTwoPi * static_cast<float>(rng.next_unit());
            launch.impulse = glm::vec3(std::sin(theta) * force, std::cos(theta) * force, 0.0f);
            launch.impulse_offset = _config.impulse_offset;

            scenario.dice.push_back(launch);
        }

        return scenario;
    }

    std::vector<glm::vec3> ScenarioGenerator::place_dice(int die_count, SeededRandom &rng, const Config &config,
                                                         bool *used_grid)
    {
        if (used_grid)
        {
            *used_grid = false;
        }

        const float half_w = usable_half(config.bounds.half_width, config.margin);
        const float half_d = usable_half(config.bounds.half_depth, config.margin);

        std::vector<glm::vec3> positions;
        positions.reserve(std::max(die_count, 0));

        bool exhausted = false;
        for (int i = 0; i < die_count; ++i)
        {
            bool valid = false;
            glm::vec3 candidate{0.0f};
            for (int attempt = 0; attempt < config.max_attempts && !valid; ++attempt)
            {
                const float x = static_cast<float>((rng.next_unit() - 0.5) * 2.0 * half_w);
                const float z = static_cast<float>((rng.next_unit() - 0.5) * 2.0 * half_d);
                const float y = config.start_height + config.start_height_jitter * static_cast<float>(rng.next_unit());
                candidate = glm::vec3(x, y, z);

                valid = std::all_of(positions.begin(), positions.end(), [&](const glm::vec3 &p) {
                    return glm::distance(candidate, p) >= config.min_separation;
                });
            }

            if (!valid)
            {
                exhausted = true;
                break;
            }
            positions.push_back(candidate);
        }

        if (exhausted)
        {
            if (used_grid)
            {
                *used_grid = true;
            }
            return grid_positions(die_count, config);
        }
        return positions;
    }

    std::vector<glm::vec3> ScenarioGenerator::grid_positions(int die_count, const Config &config)
    {
        std::vector<glm::vec3> positions;
        if (die_count <= 0)
        {
            return positions;
        }

        const float usable_w = 2.0f * usable_half(config.bounds.half_width, config.margin);
        const float usable_d = 2.0f * usable_half(config.bounds.half_depth, config.margin);

        const int cols = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(die_count))));
        const int rows = (die_count + cols - 1) / cols;

        const float spacing_x = std::min(usable_w / static_cast<float>(std::max(cols - 1, 1)), config.min_separation);
        const float spacing_z = std::min(usable_d / static_cast<float>(std::max(rows - 1, 1)), config.min_separation);

        // A degenerate footprint still has to give distinct cells.
        const float step_x = spacing_x > 0.0f ? spacing_x : config.min_separation;
        const float step_z = spacing_z > 0.0f ? spacing_z : config.min_separation;

        positions.reserve(die_count);
        for (int i = 0; i < die_count; ++i)
        {
            const int col = i % cols;
            const int row = i / cols;
            const float x = (static_cast<float>(col) - static_cast<float>(cols - 1) * 0.5f) * step_x;
            const float z = (static_cast<float>(row) - static_cast<float>(rows - 1) * 0.5f) * step_z;
            positions.emplace_back(x, config.start_height, z);
        }
        return positions;
    }
} // namespace Dice
