/**
 * @file NN.hpp
 * @brief Neurons and layers of a feedforward network.
 *
 * Provides the building blocks owned by a Network: a Neuron holds a
 * weight vector and a bias, a Layer holds neurons sharing one input
 * width and one activation.
 */

#ifndef VERITAS_NN_HPP
#define VERITAS_NN_HPP

#include <cstdint>
#include <vector>

#include "ML.hpp"

namespace veritas::nn
{

/**
 * @brief Capability of perturbing numeric parameters in place.
 *
 * Implemented by Neuron, Layer and a ready Network; each level
 * forwards the same intensity to the parts it owns.
 */
class Genetic
{
public:
    virtual ~Genetic() = default;

    /**
     * @brief Add uniform noise from [-1, 1) scaled by @p alpha to every
     * parameter. Not reversible.
     */
    virtual void mutate(double alpha) = 0;
};

/**
 * @brief A single neuron: weights, bias and last weighted sum.
 */
class Neuron : public Genetic
{

private:

    /// Member weights, one per input of the owning layer.
    std::vector<double> m_weights {};

    /// Member bias.
    double              m_bias {0.0};

    /// Member last weighted sum computed by the forward pass.
    double              m_output {0.0};

    friend class Layer;

public:

    /**
     * @brief Construct a randomly initialized neuron.
     *
     * Every weight, then the bias, is drawn uniformly from [-1, 1).
     *
     * @param input_size Number of weights.
     */
    explicit Neuron(uint64_t input_size);

    /**
     * @brief Construct a neuron from known parameters.
     */
    Neuron(std::vector<double> weights, double bias, double output = 0.0);

    /**
     * @brief Compute sum(weights[i] * inputs[i]) + bias.
     *
     * The result is also stored as the neuron's output.
     *
     * @throws dimension_error If inputs.size() != weights.size().
     */
    double weighted_sum(const std::vector<double>& inputs);

    void mutate(double alpha) override;

    const std::vector<double>& get_weights() const { return m_weights; }

    double get_bias() const { return m_bias; }

    double get_output() const { return m_output; }
};

/**
 * @brief A layer of neurons sharing an input width and an activation.
 */
class Layer : public Genetic
{

private:

    /// Member width of the vectors fed to this layer.
    uint64_t            m_input_size {0};

    /// Member neurons, in output order.
    std::vector<Neuron> m_neurons {};

    /// Member activation applied to the weighted sums.
    ml::Activation      m_activation {ml::Activation::Linear};

    /**
     * @brief Evaluate every weighted sum in one kernel on g_sycl_queue.
     *
     * One work-item per neuron accumulates its dot product in input
     * order, then the sums are copied back into the neurons' outputs.
     * The weight matrix is flattened and uploaded on every call, about
     * 8 MB for a 16384 by 64 layer.
     *
     * @throws nan_error If an input is NaN.
     * @throws device_error If the SYCL runtime reports a failure.
     */
    std::vector<double> weighted_sums_on_device(
        const std::vector<double>& inputs);

    /**
     * @brief Evaluate every weighted sum through Neuron::weighted_sum.
     *
     * @throws nan_error If an input is NaN.
     */
    std::vector<double> weighted_sums_on_host(
        const std::vector<double>& inputs);

public:

    /**
     * @brief Construct a layer of @p size randomly initialized neurons.
     *
     * @throws validation_error If @p input_size or @p size is zero.
     */
    Layer(uint64_t input_size,
        uint64_t size,
        ml::Activation activation = ml::Activation::Linear);

    /**
     * @brief Construct a layer from existing neurons.
     *
     * @throws validation_error If @p input_size is zero or @p neurons
     * is empty.
     * @throws dimension_error If a neuron does not hold @p input_size
     * weights.
     */
    Layer(uint64_t input_size,
        std::vector<Neuron> neurons,
        ml::Activation activation);

    /**
     * @brief Forward an input vector through the layer.
     *
     * Computes every neuron's weighted sum (memoized on the neuron) and
     * applies the activation to the whole vector of sums.
     *
     * @return Activated vector of get_size() values.
     * @throws dimension_error If inputs.size() != get_input_size().
     * @throws nan_error If an input is NaN.
     */
    std::vector<double> forward(const std::vector<double>& inputs);

    /// Number of neurons, equal to the output width.
    uint64_t get_size() const { return m_neurons.size(); }

    uint64_t get_input_size() const { return m_input_size; }

    ml::Activation get_activation() const { return m_activation; }

    const std::vector<Neuron>& get_neurons() const { return m_neurons; }

    /// Memoized weighted sums of the last forward pass.
    std::vector<double> outputs() const;

    void mutate(double alpha) override;
};

} // namespace veritas::nn

#endif // VERITAS_NN_HPP
