#pragma once

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cstddef>
#include <vector>

namespace Dice
{
    // Pose of one die at one simulation step.
    struct DiePose
    {
        glm::vec3 position{0.0f};
        glm::quat orientation{1.0f, 0.0f, 0.0f, 0.0f};
    };

    using TrajectoryFrame = std::vector<DiePose>;

    // ============================================================================
    // TrajectoryRecord: per-step history of every die's pose during one resolution.
    //
    // Frame index == physics step number. Append-only while the resolver runs;
    // frozen once resolution ends, after which append/clear are rejected.
    // ============================================================================

    class TrajectoryRecord
    {
    public:
        // Returns false if the record is frozen.
        bool append(TrajectoryFrame frame);

        // Drops every frame of an abandoned attempt. Returns false if frozen.
        bool clear();

        void freeze() { _frozen = true; }
        bool frozen() const { return _frozen; }

        bool empty() const { return _frames.empty(); }
        size_t size() const { return _frames.size(); }
        size_t last_index() const { return _frames.empty() ? 0 : _frames.size() - 1; }
        size_t die_count() const { return _frames.empty() ? 0 : _frames.front().size(); }

        const TrajectoryFrame &operator[](size_t index) const { return _frames[index]; }
        const TrajectoryFrame &back() const { return _frames.back(); }

        const std::vector<TrajectoryFrame> &frames() const { return _frames; }

    private:
        std::vector<TrajectoryFrame> _frames;
        bool _frozen{false};
    };
} // namespace Dice
