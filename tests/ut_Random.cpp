/**
 * @file ut_Random.cpp
 * @brief Google Test suite for the process-wide random source.
 */

#include <gtest/gtest.h>

#include <vector>

#include "veritas/Random.hpp"

using namespace veritas;

namespace Test
{

/**
 * @test RANDOM.seed_is_deterministic
 * @brief A non-zero seed replays the same sequence.
 */
TEST(RANDOM, seed_is_deterministic)
{
    random::seed(2025ULL);
    std::vector<double> a;
    for (int i = 0; i < 32; ++i)
    {
        a.push_back(random::uniform01());
    }

    random::seed(2025ULL);
    for (int i = 0; i < 32; ++i)
    {
        EXPECT_EQ(random::uniform01(), a[i]);
    }
}

/**
 * @test RANDOM.draws_stay_in_range
 */
TEST(RANDOM, draws_stay_in_range)
{
    random::seed(0ULL);
    for (int i = 0; i < 10000; ++i)
    {
        const double u = random::uniform01();
        EXPECT_GE(u, 0.0);
        EXPECT_LT(u, 1.0);

        const double s = random::symmetric();
        EXPECT_GE(s, -1.0);
        EXPECT_LT(s, 1.0);

        const double r = random::uniform(-0.25, 0.75);
        EXPECT_GE(r, -0.25);
        EXPECT_LT(r, 0.75);
    }
}

/**
 * @test RANDOM.uniform_covers_interval
 * @brief Draws spread over both halves of the interval.
 */
TEST(RANDOM, uniform_covers_interval)
{
    random::seed(17ULL);
    int low = 0;
    int high = 0;
    for (int i = 0; i < 1000; ++i)
    {
        if (random::symmetric() < 0.0)
        {
            ++low;
        }
        else
        {
            ++high;
        }
    }
    EXPECT_GT(low, 400);
    EXPECT_GT(high, 400);
}

} // namespace Test
