#include "seeded_random.h"

#include <chrono>

namespace Dice
{
    uint64_t hash_seed(std::string_view seed)
    {
        uint64_t hash = 0xcbf29ce484222325ull;
        for (unsigned char c : seed)
        {
            hash ^= c;
            hash *= 0x100000001b3ull;
        }
        return hash;
    }

    std::string make_random_seed()
    {
        static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";

        std::random_device device;
        uint64_t value = (static_cast<uint64_t>(device()) << 32) ^ device();
        value ^= static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());

        std::string seed;
        do
        {
            seed.push_back(kDigits[value % 36]);
            value /= 36;
        } while (value != 0);
        return seed;
    }
} // namespace Dice
