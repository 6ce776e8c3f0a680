/**
 * @file NN.cpp
 * @brief Neuron and layer definitions.
 */

#include "veritas/NN.hpp"
#include "veritas/Errors.hpp"
#include "veritas/Random.hpp"
#include "veritas/SYCLQueue.hpp"
#include "veritas/SYCLUtils.hpp"

#include <cmath>
#include <string>

namespace veritas::nn
{

Neuron::Neuron(uint64_t input_size)
{
    m_weights.reserve(input_size);
    for (uint64_t i = 0; i < input_size; ++i)
    {
        m_weights.push_back(random::symmetric());
    }
    m_bias = random::symmetric();
}

Neuron::Neuron(std::vector<double> weights, double bias, double output)
    : m_weights(std::move(weights)),
      m_bias(bias),
      m_output(output)
{
}

double Neuron::weighted_sum(const std::vector<double>& inputs)
{
    VERITAS_CHECK(inputs.size() != m_weights.size(),
        dimension_error,
        "weighted_sum: " + std::to_string(inputs.size()) +
        " inputs for " + std::to_string(m_weights.size()) + " weights.");

    double acc = 0.0;
    for (uint64_t i = 0; i < m_weights.size(); ++i)
    {
        acc += m_weights[i] * inputs[i];
    }
    m_output = acc + m_bias;

    return m_output;
}

void Neuron::mutate(double alpha)
{
    for (double& weight : m_weights)
    {
        weight += random::symmetric() * alpha;
    }
    m_bias += random::symmetric() * alpha;
}

Layer::Layer(uint64_t input_size, uint64_t size, ml::Activation activation)
    : m_input_size(input_size),
      m_activation(activation)
{
    VERITAS_CHECK(input_size == 0,
        validation_error,
        R"(Layer: input size must be positive.)");

    VERITAS_CHECK(size == 0,
        validation_error,
        R"(Layer: a layer needs at least one neuron.)");

    m_neurons.reserve(size);
    for (uint64_t i = 0; i < size; ++i)
    {
        m_neurons.emplace_back(input_size);
    }
}

Layer::Layer(uint64_t input_size,
    std::vector<Neuron> neurons,
    ml::Activation activation)
    : m_input_size(input_size),
      m_neurons(std::move(neurons)),
      m_activation(activation)
{
    VERITAS_CHECK(input_size == 0,
        validation_error,
        R"(Layer: input size must be positive.)");

    VERITAS_CHECK(m_neurons.empty(),
        validation_error,
        R"(Layer: a layer needs at least one neuron.)");

    for (uint64_t n = 0; n < m_neurons.size(); ++n)
    {
        VERITAS_CHECK(m_neurons[n].m_weights.size() != input_size,
            dimension_error,
            "Layer: neuron " + std::to_string(n) + " has " +
            std::to_string(m_neurons[n].m_weights.size()) +
            " weights, layer input size is " +
            std::to_string(input_size) + ".");
    }
}

std::vector<double> Layer::forward(const std::vector<double>& inputs)
{
    VERITAS_CHECK(inputs.size() != m_input_size,
        dimension_error,
        "forward: layer expects " + std::to_string(m_input_size) +
        " inputs, got " + std::to_string(inputs.size()) + ".");

    std::vector<double> sums;
    if (device_supports_fp64())
    {
        sums = weighted_sums_on_device(inputs);
    }
    else
    {
        sums = weighted_sums_on_host(inputs);
    }

    return ml::apply(m_activation, sums);
}

std::vector<double> Layer::weighted_sums_on_host(
    const std::vector<double>& inputs)
{
    for (double input : inputs)
    {
        VERITAS_CHECK(std::isnan(input),
            nan_error,
            R"(forward: NaN detected in inputs.)");
    }

    std::vector<double> sums;
    sums.reserve(m_neurons.size());
    for (Neuron& neuron : m_neurons)
    {
        sums.push_back(neuron.weighted_sum(inputs));
    }
    return sums;
}

std::vector<double> Layer::weighted_sums_on_device(
    const std::vector<double>& inputs)
{
    const uint64_t n_in = m_input_size;
    const uint64_t n_out = m_neurons.size();

    std::vector<double> weights;
    weights.reserve(n_in * n_out);
    std::vector<double> biases;
    biases.reserve(n_out);
    for (const Neuron& neuron : m_neurons)
    {
        weights.insert(weights.end(),
            neuron.m_weights.begin(), neuron.m_weights.end());
        biases.push_back(neuron.m_bias);
    }

    std::vector<double> sums;
    try
    {
        sycl_utils::SyclArray<double> weights_arr(g_sycl_queue,
            weights, MemoryLocation::DEVICE);
        sycl_utils::SyclArray<double> biases_arr(g_sycl_queue,
            biases, MemoryLocation::DEVICE);
        sycl_utils::SyclArray<double> inputs_arr(g_sycl_queue,
            inputs, MemoryLocation::DEVICE);
        sycl_utils::SyclArray<double> sums_arr(g_sycl_queue,
            n_out, MemoryLocation::DEVICE);
        sycl_utils::SyclArray<int32_t> error_flag_arr(g_sycl_queue,
            1, MemoryLocation::HOST);

        const double* p_weights = weights_arr;
        const double* p_biases = biases_arr;
        const double* p_inputs = inputs_arr;
        double* p_sums = sums_arr;
        int32_t* p_error_flag = error_flag_arr;

        *p_error_flag = 0;

        g_sycl_queue.submit([&](sycl::handler& cgh)
        {
            cgh.parallel_for(sycl::range<1>(static_cast<size_t>(n_out)),
                [=](sycl::id<1> id)
            {
                const uint64_t o = static_cast<uint64_t>(id[0]);
                const double* p_row = p_weights + o * n_in;

                double acc = 0.0;
                for (uint64_t i = 0; i < n_in; ++i)
                {
                    const double x = p_inputs[i];
                    VERITAS_DEVICE_CHECK(sycl_utils::is_nan(x),
                        p_error_flag, 1);
                    acc += p_row[i] * x;
                }
                p_sums[o] = acc + p_biases[o];
            });
        }).wait();

        int32_t err = *p_error_flag;

        VERITAS_CHECK(err == 1,
            nan_error,
            R"(forward: NaN detected in inputs.)");

        sums = sums_arr.to_host();
    }
    catch (const sycl::exception& e)
    {
        throw device_error(std::string("forward: ") + e.what());
    }

    for (uint64_t o = 0; o < n_out; ++o)
    {
        m_neurons[o].m_output = sums[o];
    }

    return sums;
}

std::vector<double> Layer::outputs() const
{
    std::vector<double> out;
    out.reserve(m_neurons.size());
    for (const Neuron& neuron : m_neurons)
    {
        out.push_back(neuron.m_output);
    }
    return out;
}

void Layer::mutate(double alpha)
{
    for (Neuron& neuron : m_neurons)
    {
        neuron.mutate(alpha);
    }
}

} // namespace veritas::nn
