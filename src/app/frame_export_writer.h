#pragma once

#include "playback/playback_interpolator.h"

#include <string>
#include <vector>

namespace App
{
    // Writes frame_0000.json ... plus index.json ({"frames": [{"file", "duration_ms"}]})
    // into `directory`, creating it if needed.
    // Returns false on IO failure (errors logged via Logger).
    bool write_frame_export(const std::string &directory, const std::vector<Playback::FrameExport> &frames);
} // namespace App
