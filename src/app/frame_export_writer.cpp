#include "frame_export_writer.h"
#include "core/util/logger.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace App
{
    using json = nlohmann::json;

    namespace
    {
        bool write_text(const std::filesystem::path &path, const std::string &text)
        {
            std::ofstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                Logger::error("Failed to open '{}' for writing", path.string());
                return false;
            }
            file << text;
            if (!file.good())
            {
                Logger::error("Failed to write '{}'", path.string());
                return false;
            }
            return true;
        }
    } // namespace

    bool write_frame_export(const std::string &directory, const std::vector<Playback::FrameExport> &frames)
    {
        namespace fs = std::filesystem;

        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec)
        {
            Logger::error("Failed to create export directory '{}': {}", directory, ec.message());
            return false;
        }

        json index;
        index["frames"] = json::array();

        for (size_t i = 0; i < frames.size(); ++i)
        {
            const std::string name = fmt::format("frame_{:04}.json", i);
            if (!write_text(fs::path(directory) / name, frames[i].frame))
            {
                return false;
            }

            json entry;
            entry["file"] = name;
            entry["duration_ms"] = frames[i].duration_ms.has_value() ? json(*frames[i].duration_ms) : json(nullptr);
            index["frames"].push_back(std::move(entry));
        }

        if (!write_text(fs::path(directory) / "index.json", index.dump(2)))
        {
            return false;
        }

        Logger::info("Wrote {} frames to '{}'", frames.size(), directory);
        return true;
    }
} // namespace App
