#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace Dice
{
    // 64-bit FNV-1a over the seed text.
    uint64_t hash_seed(std::string_view seed);

    // Unpredictable base-36 seed (a-z0-9), used when the caller gives none and
    // for every stuck-retry attempt.
    std::string make_random_seed();

    // Deterministic stream of uniform draws for one seed string.
    // Draws are built from raw mt19937_64 output, so replays match across
    // standard library implementations.
    class SeededRandom
    {
    public:
        explicit SeededRandom(std::string_view seed) : _gen(hash_seed(seed))
        {
        }

        // [0, 1)
        double next_unit()
        {
            return static_cast<double>(_gen() >> 11) * 0x1.0p-53;
        }

    private:
        std::mt19937_64 _gen;
    };
} // namespace Dice
