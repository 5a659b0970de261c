// Command-line dice tray.
//
// Rolls the dice, plays the recorded trajectory back through a headless
// presenter at display rate, and prints the outcome log. With --export the
// captured frames are written to disk.

#include "app/frame_export_writer.h"
#include "app/pose_presenter.h"
#include "app/roll_config.h"
#include "app/simulation.h"
#include "core/config.h"
#include "core/util/logger.h"
#include "physics/jolt/jolt_physics_world.h"
#include "runtime/clock.h"
#include "runtime/frame_loop.h"

#include <fmt/core.h>

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if !(defined(DICETRAY_USE_JOLT) && DICETRAY_USE_JOLT)
#error "dicetray needs the Jolt backend (DICETRAY_USE_JOLT)"
#endif

namespace
{
    struct CliOptions
    {
        std::optional<std::string> config_path;
        std::optional<std::string> save_config_path;
        std::string query;
        std::optional<std::string> export_dir;
        std::optional<std::string> log_level;
        int rolls{1};
        bool pacing{true};
        bool help{false};
    };

    void print_usage()
    {
        fmt::print(
            "usage: dicetray [options]\n"
            "  --config <file>        load roll settings from JSON\n"
            "  --query <k=v&...>      roll parameters (numberOfDice, seed, desiredRolls, magic,\n"
            "                         storeFrames, renderFixedFrames, width, depth, ...)\n"
            "  --dice <n>             number of dice (1-10)\n"
            "  --seed <text>          seed of the first roll\n"
            "  --rolls <n>            number of rolls (default 1)\n"
            "  --export <dir>         store playback frames and write them to <dir>\n"
            "  --save-config <file>   write the effective settings as JSON\n"
            "  --log-level <level>    debug, info, warn or error\n"
            "  --no-pacing            play back without waiting for the refresh interval\n"
            "  --help                 show this text\n");
    }

    void append_query(std::string &query, std::string_view params)
    {
        if (params.empty())
        {
            return;
        }
        if (!query.empty())
        {
            query.push_back('&');
        }
        query.append(params);
    }

    void append_param(std::string &query, std::string_view key, std::string_view value)
    {
        append_query(query, fmt::format("{}={}", key, value));
    }

    // Returns std::nullopt on a malformed command line.
    std::optional<CliOptions> parse_args(int argc, char *argv[])
    {
        CliOptions opts;
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            auto value = [&]() -> std::optional<std::string> {
                if (i + 1 >= argc)
                {
                    Logger::error("Missing value for {}", arg);
                    return std::nullopt;
                }
                return std::string(argv[++i]);
            };

            if (arg == "--help" || arg == "-h")
            {
                opts.help = true;
            }
            else if (arg == "--no-pacing")
            {
                opts.pacing = false;
            }
            else if (arg == "--config" || arg == "--query" || arg == "--dice" || arg == "--seed" ||
                     arg == "--rolls" || arg == "--export" || arg == "--save-config" || arg == "--log-level")
            {
                std::optional<std::string> v = value();
                if (!v)
                {
                    return std::nullopt;
                }

                if (arg == "--config") opts.config_path = *v;
                else if (arg == "--query") append_query(opts.query, *v);
                else if (arg == "--dice") append_param(opts.query, "numberOfDice", *v);
                else if (arg == "--seed") append_param(opts.query, "seed", *v);
                else if (arg == "--export") opts.export_dir = *v;
                else if (arg == "--save-config") opts.save_config_path = *v;
                else if (arg == "--log-level") opts.log_level = *v;
                else if (arg == "--rolls")
                {
                    char *end = nullptr;
                    const long n = std::strtol(v->c_str(), &end, 10);
                    if (end == v->c_str() || *end != '\0' || n < 1)
                    {
                        Logger::error("--rolls expects a positive integer, got '{}'", *v);
                        return std::nullopt;
                    }
                    opts.rolls = static_cast<int>(n);
                }
            }
            else
            {
                Logger::error("Unknown argument '{}'", arg);
                return std::nullopt;
            }
        }
        return opts;
    }

    LogLevel resolve_log_level(const CliOptions &opts)
    {
        std::string_view name = logLevelOverride();
        if (opts.log_level)
        {
            name = *opts.log_level;
        }
        if (name.empty())
        {
            return LogLevel::Info;
        }
        if (auto level = Logger::parse_level(name))
        {
            return *level;
        }
        Logger::warn("Unknown log level '{}', using info", name);
        return LogLevel::Info;
    }

    std::string faces_text(const std::vector<int> &faces)
    {
        std::string out;
        for (size_t i = 0; i < faces.size(); ++i)
        {
            if (i > 0)
            {
                out.push_back(' ');
            }
            out += std::to_string(faces[i]);
        }
        return out;
    }
} // namespace

int main(int argc, char *argv[])
{
    Logger::init(LogOutput::Console, LogLevel::Info);

    std::optional<CliOptions> parsed = parse_args(argc, argv);
    if (!parsed)
    {
        print_usage();
        return 2;
    }
    const CliOptions &opts = *parsed;
    if (opts.help)
    {
        print_usage();
        return 0;
    }
    Logger::set_level(resolve_log_level(opts));

    App::RollConfig config;
    if (opts.config_path)
    {
        std::optional<App::RollConfig> loaded = App::load_roll_config(*opts.config_path, config);
        if (!loaded)
        {
            return 1;
        }
        config = *loaded;
    }
    if (!opts.query.empty())
    {
        App::apply_query_string(config, opts.query);
    }
    if (opts.export_dir)
    {
        config.store_frames = true;
    }
    App::normalize_desired_rolls(config);

    if (opts.save_config_path && !App::save_roll_config(*opts.save_config_path, config))
    {
        return 1;
    }

    Physics::JoltPhysicsWorld::Config world_config{};
    world_config.gravity = glm::vec3(0.0f, kGravityY, 0.0f);
    world_config.time_before_sleep = kDieSleepTime;

    Runtime::SteadyClock clock;
    Runtime::FrameLoop frame_loop(clock, kSimulationRateHz);
    frame_loop.time().set_pacing(opts.pacing);

    App::PosePresenter presenter;
    App::Simulation simulation(std::make_unique<Physics::JoltPhysicsWorld>(world_config),
                               frame_loop, presenter, clock, config);

    int exit_code = 0;
    for (int roll = 0; roll < opts.rolls; ++roll)
    {
        simulation.throw_dice(roll == 0 ? config.seed : std::nullopt);
        const uint64_t frames = frame_loop.run_until_idle();

        const auto outcome = simulation.last_outcome();
        Logger::debug("Played {} frames ({} recorded steps)", frames, outcome->trajectory.size());

        fmt::print("{}\n", simulation.outcome_log().text());
        if (outcome->timed_out())
        {
            fmt::print("faces: {} (timed out)\n", faces_text(outcome->face_values));
        }
        if (config.magic)
        {
            fmt::print("shown: {}\n", faces_text(config.desired_rolls));
        }

        App::RollConfig replay = config;
        replay.seed = outcome->seed;
        Logger::info("Replay with --query \"{}\"", App::to_query_string(replay));

        if (opts.export_dir)
        {
            const std::string dir = opts.rolls > 1 ? fmt::format("{}/roll_{:03}", *opts.export_dir, roll)
                                                   : *opts.export_dir;
            if (!App::write_frame_export(dir, simulation.playback().exported_frames()))
            {
                exit_code = 1;
            }
        }
    }

    Logger::shutdown();
    return exit_code;
}
