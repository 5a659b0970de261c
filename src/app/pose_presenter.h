#pragma once

#include "playback/presenter.h"

#include <cstdint>
#include <string>

namespace App
{
    // Headless presenter: keeps the last frame and encodes it as JSON,
    // {"frame": n, "dice": [{"position": [x,y,z], "orientation": [w,x,y,z]}, ...]}.
    class PosePresenter final : public Playback::Presenter
    {
    public:
        void present(const Dice::TrajectoryFrame &poses) override;
        std::string capture_frame() override;

        const Dice::TrajectoryFrame &last_frame() const { return _last; }
        uint64_t frame_count() const { return _count; }

        static std::string encode(const Dice::TrajectoryFrame &poses, uint64_t frame_number);

    private:
        Dice::TrajectoryFrame _last;
        uint64_t _count{0};
    };
} // namespace App
