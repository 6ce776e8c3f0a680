/**
 * @file ut_Datapoint.cpp
 * @brief Google Test suite for datapoints and datasets.
 */

#include <gtest/gtest.h>

#include "veritas/Datapoint.hpp"
#include "veritas/Random.hpp"

using namespace veritas;

namespace Test
{

/**
 * @test DATAPOINT.targets_follow_label
 */
TEST(DATAPOINT, targets_follow_label)
{
    data::Datapoint real({0.1, 0.2}, data::Label::Real);
    data::Datapoint fake({0.1, 0.2}, data::Label::Fake);

    EXPECT_EQ(real.targets(), std::vector<double>({1.0, 0.0}));
    EXPECT_EQ(fake.targets(), std::vector<double>({0.0, 1.0}));
}

/**
 * @test DATAPOINT.add_noise_returns_new_datapoint
 * @brief The original is untouched, the noise is returned and the
 * noisy inputs are the sum of both.
 */
TEST(DATAPOINT, add_noise_returns_new_datapoint)
{
    random::seed(7ULL);
    const std::vector<double> inputs = {0.0, 0.25, 0.5, 0.99};
    const data::Datapoint original(inputs, data::Label::Fake);

    const auto [noisy, noise] = original.add_noise(0.5);

    EXPECT_EQ(original.inputs(), inputs);
    EXPECT_EQ(noisy.label(), data::Label::Fake);
    ASSERT_EQ(noise.size(), inputs.size());
    ASSERT_EQ(noisy.inputs().size(), inputs.size());

    for (uint64_t i = 0; i < inputs.size(); ++i)
    {
        EXPECT_DOUBLE_EQ(noisy.inputs()[i], inputs[i] + noise[i]);
        EXPECT_GE(noise[i], -inputs[i] * 0.5);
        EXPECT_LT(noise[i], (1.0 - inputs[i]) * 0.5);
    }
}

/**
 * @test DATAPOINT.full_noise_stays_in_unit_interval
 */
TEST(DATAPOINT, full_noise_stays_in_unit_interval)
{
    random::seed(11ULL);
    std::vector<double> inputs;
    for (int i = 0; i < 256; ++i)
    {
        inputs.push_back(static_cast<double>(i) / 256.0);
    }
    const data::Datapoint original(inputs);

    const auto [noisy, noise] = original.add_noise(1.0);
    for (double v : noisy.inputs())
    {
        EXPECT_GE(v, 0.0);
        EXPECT_LT(v, 1.0);
    }
}

/**
 * @test DATAPOINT.zero_alpha_adds_nothing
 */
TEST(DATAPOINT, zero_alpha_adds_nothing)
{
    const data::Datapoint original({0.3, 0.6, 0.9});
    const auto [noisy, noise] = original.add_noise(0.0);

    for (uint64_t i = 0; i < noise.size(); ++i)
    {
        EXPECT_DOUBLE_EQ(noise[i], 0.0);
        EXPECT_DOUBLE_EQ(noisy.inputs()[i], original.inputs()[i]);
    }
}

/**
 * @test DATASET.add_and_iterate
 */
TEST(DATASET, add_and_iterate)
{
    data::Dataset dataset;
    EXPECT_TRUE(dataset.empty());

    dataset.add(data::Datapoint({0.1}, data::Label::Real));
    dataset.add(data::Datapoint({0.2}, data::Label::Fake));

    EXPECT_EQ(dataset.size(), 2u);
    std::vector<data::Label> labels;
    for (const data::Datapoint& datapoint : dataset)
    {
        labels.push_back(datapoint.label());
    }
    EXPECT_EQ(labels, std::vector<data::Label>(
        {data::Label::Real, data::Label::Fake}));
    EXPECT_DOUBLE_EQ(dataset.datapoints()[1].inputs()[0], 0.2);
}

} // namespace Test
