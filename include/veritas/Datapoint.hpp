/**
 * @file Datapoint.hpp
 * @brief Labeled input vectors and datasets.
 */

#ifndef VERITAS_DATAPOINT_HPP
#define VERITAS_DATAPOINT_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include "Label.hpp"

namespace veritas::data
{

/**
 * @brief An input vector with its label.
 *
 * Immutable once created; noise injection returns a new Datapoint.
 */
class Datapoint
{

private:

    /// Member input values, normally in [0, 1).
    std::vector<double> m_inputs {};

    /// Member label of the input.
    Label               m_label {Label::Real};

public:

    Datapoint() = default;

    /**
     * @brief Construct a datapoint from its inputs and label.
     */
    explicit Datapoint(std::vector<double> inputs, Label label = Label::Real);

    const std::vector<double>& inputs() const { return m_inputs; }

    Label label() const { return m_label; }

    /// One-hot encoding of the label.
    std::vector<double> targets() const;

    /**
     * @brief Produce a noisy copy of this datapoint.
     *
     * For every input v the perturbation is drawn uniformly from
     * [-v, 1 - v) and scaled by @p alpha, so with alpha in [0, 1] the
     * perturbed value stays in [0, 1).
     *
     * @param alpha Noise intensity.
     * @return The noisy datapoint (same label) and the noise vector added.
     */
    std::pair<Datapoint, std::vector<double>> add_noise(double alpha) const;
};

/**
 * @brief Ordered collection of datapoints.
 */
class Dataset
{

private:

    std::vector<Datapoint> m_datapoints {};

public:

    Dataset() = default;

    explicit Dataset(std::vector<Datapoint> datapoints);

    /// Append a datapoint.
    void add(Datapoint datapoint);

    const std::vector<Datapoint>& datapoints() const { return m_datapoints; }

    uint64_t size() const { return m_datapoints.size(); }

    bool empty() const { return m_datapoints.empty(); }

    std::vector<Datapoint>::const_iterator begin() const
    {
        return m_datapoints.begin();
    }

    std::vector<Datapoint>::const_iterator end() const
    {
        return m_datapoints.end();
    }
};

} // namespace veritas::data

#endif // VERITAS_DATAPOINT_HPP
