/**
 * @file Random.cpp
 * @brief Process-wide uniform random source definitions.
 */

#include "veritas/Random.hpp"

#include <random>

namespace veritas::random
{

namespace
{

uint64_t fresh_seed()
{
    std::random_device rd;
    uint64_t s = (static_cast<uint64_t>(rd()) << 32) ^
        static_cast<uint64_t>(rd());
    if (s == 0ULL) s = 0x9e3779b97f4a7c15ULL;
    return s;
}

std::mt19937_64& engine()
{
    static std::mt19937_64 s_engine{ fresh_seed() };
    return s_engine;
}

} // namespace

void seed(uint64_t seed)
{
    if (seed == 0ULL)
    {
        seed = fresh_seed();
    }
    engine().seed(seed);
}

double uniform01()
{
    // generate_canonical is not guaranteed to stay below 1.0 on every
    // standard library, so build the value from the top 53 bits.
    const uint64_t bits = engine()() >> 11;
    return static_cast<double>(bits) * (1.0 / 9007199254740992.0);
}

double uniform(double lo, double hi)
{
    return uniform01() * (hi - lo) + lo;
}

double symmetric()
{
    return uniform01() * 2.0 - 1.0;
}

} // namespace veritas::random
