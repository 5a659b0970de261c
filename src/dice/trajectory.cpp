#include "trajectory.h"

#include <utility>

namespace Dice
{
    bool TrajectoryRecord::append(TrajectoryFrame frame)
    {
        if (_frozen)
        {
            return false;
        }
        _frames.push_back(std::move(frame));
        return true;
    }

    bool TrajectoryRecord::clear()
    {
        if (_frozen)
        {
            return false;
        }
        _frames.clear();
        return true;
    }
} // namespace Dice
