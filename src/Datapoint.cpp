/**
 * @file Datapoint.cpp
 * @brief Datapoint and Dataset definitions.
 */

#include "veritas/Datapoint.hpp"
#include "veritas/Random.hpp"

namespace veritas::data
{

Datapoint::Datapoint(std::vector<double> inputs, Label label)
    : m_inputs(std::move(inputs)),
      m_label(label)
{
}

std::vector<double> Datapoint::targets() const
{
    return one_hot(m_label);
}

std::pair<Datapoint, std::vector<double>> Datapoint::add_noise(double alpha) const
{
    std::vector<double> noise;
    noise.reserve(m_inputs.size());
    for (double input : m_inputs)
    {
        const double lo = -input;
        const double hi = 1.0 - input;
        noise.push_back(random::uniform(lo, hi) * alpha);
    }

    std::vector<double> noisy;
    noisy.reserve(m_inputs.size());
    for (uint64_t i = 0; i < m_inputs.size(); ++i)
    {
        noisy.push_back(m_inputs[i] + noise[i]);
    }

    return {Datapoint(std::move(noisy), m_label), std::move(noise)};
}

Dataset::Dataset(std::vector<Datapoint> datapoints)
    : m_datapoints(std::move(datapoints))
{
}

void Dataset::add(Datapoint datapoint)
{
    m_datapoints.push_back(std::move(datapoint));
}

} // namespace veritas::data
