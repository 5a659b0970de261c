#pragma once

#include "core/config.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace App
{
    // Operator-facing roll configuration. Values are validated by the loader;
    // the simulation core takes them as-is.
    struct RollConfig
    {
        int number_of_dice{2};
        std::optional<std::string> seed;
        std::vector<int> desired_rolls{6, 3};

        bool magic{false};
        bool store_frames{false};
        bool render_fixed_frames{false};

        float arena_width{kArenaWidth};
        float arena_depth{kArenaDepth};

        // Resolver tuning
        int stuck_detection_steps{kStuckDetectionSteps};
        int max_retries{kMaxRetries};
        double timeout_ms{kResolveTimeoutMs};
    };

    // Resize desired_rolls to number_of_dice, padding with 1.
    void normalize_desired_rolls(RollConfig &config);

    // Load a RollConfig from a JSON file on top of `base`.
    // Returns std::nullopt on parse/IO failure (errors logged via Logger).
    // Individual invalid fields are skipped with a warning.
    std::optional<RollConfig> load_roll_config(const std::string &json_path, const RollConfig &base = {});

    // Same as load_roll_config, from JSON text.
    std::optional<RollConfig> parse_roll_config(std::string_view json_text, const RollConfig &base = {});

    // Apply `key=value&key=value` parameters (camelCase or snake_case keys).
    // Unknown keys and invalid values are skipped with a warning.
    void apply_query_string(RollConfig &config, std::string_view query);

    // Parameters that reproduce `config` through apply_query_string().
    std::string to_query_string(const RollConfig &config);

    // Serialize a RollConfig to a JSON string (for saving/debugging).
    std::string serialize_roll_config(const RollConfig &config);

    // Save a RollConfig to a JSON file.
    // Returns false on IO failure (errors logged via Logger).
    bool save_roll_config(const std::string &json_path, const RollConfig &config);
} // namespace App
