#include "roll_config.h"
#include "core/util/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace App
{
    using json = nlohmann::json;

    namespace
    {
        // ---- Field readers: missing or null keeps the current value ----

        bool has_field(const json &j, const char *key)
        {
            return j.contains(key) && !j[key].is_null();
        }

        void read_int(const json &j, const char *key, int lo, int hi, int &out)
        {
            if (!has_field(j, key))
            {
                return;
            }
            const json &v = j[key];
            if (!v.is_number_integer())
            {
                Logger::warn("Config '{}' must be an integer, keeping {}", key, out);
                return;
            }
            const int64_t value = v.get<int64_t>();
            if (value < lo || value > hi)
            {
                Logger::warn("Config '{}' = {} outside [{}, {}], keeping {}", key, value, lo, hi, out);
                return;
            }
            out = static_cast<int>(value);
        }

        template<typename T>
        void read_positive(const json &j, const char *key, double min_value, T &out)
        {
            if (!has_field(j, key))
            {
                return;
            }
            const json &v = j[key];
            if (!v.is_number())
            {
                Logger::warn("Config '{}' must be a number, keeping {}", key, out);
                return;
            }
            const double value = v.get<double>();
            if (!std::isfinite(value) || value < min_value)
            {
                Logger::warn("Config '{}' = {} below {}, keeping {}", key, value, min_value, out);
                return;
            }
            out = static_cast<T>(value);
        }

        void read_bool(const json &j, const char *key, bool &out)
        {
            if (!has_field(j, key))
            {
                return;
            }
            const json &v = j[key];
            if (v.is_boolean())
            {
                out = v.get<bool>();
                return;
            }
            if (v.is_number_integer() && (v.get<int64_t>() == 0 || v.get<int64_t>() == 1))
            {
                out = v.get<int64_t>() == 1;
                return;
            }
            Logger::warn("Config '{}' must be a boolean, keeping {}", key, out);
        }

        void read_seed(const json &j, RollConfig &cfg)
        {
            if (!has_field(j, "seed"))
            {
                return;
            }
            const json &v = j["seed"];
            if (!v.is_string() || v.get<std::string>().empty())
            {
                Logger::warn("Config 'seed' must be a non-empty string, ignoring");
                return;
            }
            cfg.seed = v.get<std::string>();
        }

        void read_desired_rolls(const json &j, RollConfig &cfg)
        {
            if (!has_field(j, "desired_rolls"))
            {
                return;
            }
            const json &v = j["desired_rolls"];
            if (!v.is_array())
            {
                Logger::warn("Config 'desired_rolls' must be an array, keeping defaults");
                return;
            }

            std::vector<int> rolls;
            rolls.reserve(v.size());
            for (const auto &elem : v)
            {
                if (!elem.is_number_integer() || elem.get<int64_t>() < 1 || elem.get<int64_t>() > 6)
                {
                    Logger::warn("Config 'desired_rolls' entries must be integers 1-6, keeping defaults");
                    return;
                }
                rolls.push_back(static_cast<int>(elem.get<int64_t>()));
            }
            cfg.desired_rolls = std::move(rolls);
        }

        void apply_json(const json &root, RollConfig &cfg)
        {
            if (!root.is_object())
            {
                Logger::warn("Roll config root must be a JSON object, ignoring");
                return;
            }

            read_int(root, "number_of_dice", kMinDice, kMaxDice, cfg.number_of_dice);
            read_seed(root, cfg);
            read_desired_rolls(root, cfg);

            read_bool(root, "magic", cfg.magic);
            read_bool(root, "store_frames", cfg.store_frames);
            read_bool(root, "render_fixed_frames", cfg.render_fixed_frames);

            // The footprint has to hold the fallback grid for the most dice.
            read_positive(root, "arena_width", static_cast<double>(kMinArenaExtent), cfg.arena_width);
            read_positive(root, "arena_depth", static_cast<double>(kMinArenaExtent), cfg.arena_depth);

            read_int(root, "stuck_detection_steps", 1, 1000000, cfg.stuck_detection_steps);
            read_int(root, "max_retries", 0, 1000, cfg.max_retries);
            read_positive(root, "timeout_ms", 1.0, cfg.timeout_ms);

            normalize_desired_rolls(cfg);
        }

        // ---- Query parameters ----

        struct QueryKey
        {
            std::string_view param;
            const char *field;
        };

        constexpr std::array<QueryKey, 20> kQueryKeys{{
                {"numberOfDice", "number_of_dice"},
                {"number_of_dice", "number_of_dice"},
                {"seed", "seed"},
                {"desiredRolls", "desired_rolls"},
                {"desired_rolls", "desired_rolls"},
                {"magic", "magic"},
                {"storeFrames", "store_frames"},
                {"store_frames", "store_frames"},
                {"renderFixedFrames", "render_fixed_frames"},
                {"render_fixed_frames", "render_fixed_frames"},
                {"width", "arena_width"},
                {"arena_width", "arena_width"},
                {"depth", "arena_depth"},
                {"arena_depth", "arena_depth"},
                {"stuckDetectionSteps", "stuck_detection_steps"},
                {"stuck_detection_steps", "stuck_detection_steps"},
                {"maxRetries", "max_retries"},
                {"max_retries", "max_retries"},
                {"timeoutMs", "timeout_ms"},
                {"timeout_ms", "timeout_ms"},
        }};

        const char *field_for_param(std::string_view param)
        {
            for (const QueryKey &k : kQueryKeys)
            {
                if (k.param == param)
                {
                    return k.field;
                }
            }
            return nullptr;
        }

        int hex_value(char c)
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        std::string url_decode(std::string_view in)
        {
            std::string out;
            out.reserve(in.size());
            for (size_t i = 0; i < in.size(); ++i)
            {
                const char c = in[i];
                if (c == '+')
                {
                    out.push_back(' ');
                }
                else if (c == '%' && i + 2 < in.size() && hex_value(in[i + 1]) >= 0 && hex_value(in[i + 2]) >= 0)
                {
                    out.push_back(static_cast<char>(hex_value(in[i + 1]) * 16 + hex_value(in[i + 2])));
                    i += 2;
                }
                else
                {
                    out.push_back(c);
                }
            }
            return out;
        }

        std::string url_encode(std::string_view in)
        {
            static constexpr char kHex[] = "0123456789ABCDEF";
            std::string out;
            for (unsigned char c : in)
            {
                if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
                {
                    out.push_back(static_cast<char>(c));
                }
                else
                {
                    out.push_back('%');
                    out.push_back(kHex[c >> 4]);
                    out.push_back(kHex[c & 0x0F]);
                }
            }
            return out;
        }

        // Seeds stay text; everything else is read as a JSON scalar or array.
        json query_value(const char *field, const std::string &raw)
        {
            if (std::string_view(field) == "seed")
            {
                return json(raw);
            }
            json parsed = json::parse(raw, nullptr, false);
            if (parsed.is_discarded())
            {
                return json(raw);
            }
            return parsed;
        }
    } // namespace

    void normalize_desired_rolls(RollConfig &config)
    {
        const size_t count = static_cast<size_t>(std::max(config.number_of_dice, 0));
        config.desired_rolls.resize(count, 1);
    }

    std::optional<RollConfig> parse_roll_config(std::string_view json_text, const RollConfig &base)
    {
        json root;
        try
        {
            root = json::parse(json_text.begin(), json_text.end());
        }
        catch (const json::parse_error &e)
        {
            Logger::error("JSON parse error in roll config: {}", e.what());
            return std::nullopt;
        }

        RollConfig cfg = base;
        apply_json(root, cfg);
        return cfg;
    }

    std::optional<RollConfig> load_roll_config(const std::string &json_path, const RollConfig &base)
    {
        std::ifstream file(json_path);
        if (!file.is_open())
        {
            Logger::error("Failed to open roll config file: {}", json_path);
            return std::nullopt;
        }

        json root;
        try
        {
            file >> root;
        }
        catch (const json::parse_error &e)
        {
            Logger::error("JSON parse error in '{}': {}", json_path, e.what());
            return std::nullopt;
        }

        RollConfig cfg = base;
        apply_json(root, cfg);
        Logger::info("Loaded roll config '{}' ({} dice)", json_path, cfg.number_of_dice);
        return cfg;
    }

    void apply_query_string(RollConfig &config, std::string_view query)
    {
        if (!query.empty() && query.front() == '?')
        {
            query.remove_prefix(1);
        }

        json params = json::object();
        while (!query.empty())
        {
            const size_t amp = query.find('&');
            const std::string_view pair = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

            if (pair.empty())
            {
                continue;
            }

            const size_t eq = pair.find('=');
            const std::string key = url_decode(pair.substr(0, eq));
            const std::string value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));

            const char *field = field_for_param(key);
            if (!field)
            {
                Logger::warn("Unknown roll parameter '{}', ignoring", key);
                continue;
            }
            params[field] = query_value(field, value);
        }

        apply_json(params, config);
    }

    std::string to_query_string(const RollConfig &config)
    {
        std::ostringstream out;
        out << "numberOfDice=" << config.number_of_dice;
        if (config.seed.has_value())
        {
            out << "&seed=" << url_encode(*config.seed);
        }
        out << "&desiredRolls=" << url_encode(json(config.desired_rolls).dump());
        out << "&magic=" << (config.magic ? "true" : "false");
        out << "&storeFrames=" << (config.store_frames ? "true" : "false");
        out << "&renderFixedFrames=" << (config.render_fixed_frames ? "true" : "false");
        return out.str();
    }

    std::string serialize_roll_config(const RollConfig &config)
    {
        json root;
        root["schema_version"] = 1;
        root["number_of_dice"] = config.number_of_dice;
        root["seed"] = config.seed.has_value() ? json(*config.seed) : json(nullptr);
        root["desired_rolls"] = config.desired_rolls;
        root["magic"] = config.magic;
        root["store_frames"] = config.store_frames;
        root["render_fixed_frames"] = config.render_fixed_frames;
        root["arena_width"] = config.arena_width;
        root["arena_depth"] = config.arena_depth;
        root["stuck_detection_steps"] = config.stuck_detection_steps;
        root["max_retries"] = config.max_retries;
        root["timeout_ms"] = config.timeout_ms;
        return root.dump(2);
    }

    bool save_roll_config(const std::string &json_path, const RollConfig &config)
    {
        std::ofstream file(json_path);
        if (!file.is_open())
        {
            Logger::error("Failed to open roll config file for writing: {}", json_path);
            return false;
        }

        file << serialize_roll_config(config);
        if (!file.good())
        {
            Logger::error("Failed to write roll config file: {}", json_path);
            return false;
        }
        return true;
    }
} // namespace App
