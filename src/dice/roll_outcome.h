#pragma once

#include "trajectory.h"

#include <cstddef>
#include <string>
#include <vector>

namespace Dice
{
    enum class ResolveState
    {
        Running,
        Settled,
        TimedOut,
        Retrying
    };

    const char *resolve_state_name(ResolveState state);

    // Result of one roll. Immutable once handed out by the resolver.
    struct RollOutcome
    {
        std::vector<int> face_values;  // one per die, each in [1, 6]
        TrajectoryRecord trajectory;   // frozen

        ResolveState state{ResolveState::Settled}; // Settled or TimedOut
        std::string seed;              // seed of the attempt that produced this outcome
        int retries{0};
        size_t steps{0};
        double elapsed_ms{0.0};

        bool timed_out() const { return state == ResolveState::TimedOut; }
    };
} // namespace Dice
