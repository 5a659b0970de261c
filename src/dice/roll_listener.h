#pragma once

#include <cstddef>
#include <string>

namespace Dice
{
    // Observer for live roll progress. All hooks fire on the resolving thread.
    class RollListener
    {
    public:
        virtual ~RollListener() = default;

        // A new attempt is about to be stepped; earlier reports are void.
        virtual void on_attempt_started(const std::string &seed, int attempt)
        {
            (void)seed;
            (void)attempt;
        }

        // Die reached rest on a valid face.
        virtual void on_die_settled(size_t die_index, int face)
        {
            (void)die_index;
            (void)face;
        }

        // A settled die was moved again; its earlier report is void.
        virtual void on_die_disturbed(size_t die_index)
        {
            (void)die_index;
        }
    };
} // namespace Dice
