#pragma once

#include "dice/trajectory.h"

#include <string>

namespace Playback
{
    // Presentation side of playback: draws one frame of die poses and can
    // encode the last drawn frame for export.
    class Presenter
    {
    public:
        virtual ~Presenter() = default;

        virtual void present(const Dice::TrajectoryFrame &poses) = 0;

        // Opaque encoding of the most recently presented frame.
        virtual std::string capture_frame() = 0;
    };
} // namespace Playback
