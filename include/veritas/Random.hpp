/**
 * @file Random.hpp
 * @brief Process-wide uniform random source.
 *
 * Weight initialization, mutation and noise injection all draw from the
 * same generator, so seeding it once makes a whole run reproducible.
 */

#ifndef VERITAS_RANDOM_HPP
#define VERITAS_RANDOM_HPP

#include <cstdint>

namespace veritas::random
{

/**
 * @brief Reseed the process-wide generator.
 *
 * @param seed RNG seed. If zero the implementation seeds from
 * std::random_device; non-zero seeds produce deterministic output.
 */
void seed(uint64_t seed);

/**
 * @brief Draw a value uniformly from [0, 1).
 */
double uniform01();

/**
 * @brief Draw a value uniformly from [lo, hi).
 */
double uniform(double lo, double hi);

/**
 * @brief Draw a value uniformly from [-1, 1).
 */
double symmetric();

} // namespace veritas::random

#endif // VERITAS_RANDOM_HPP
