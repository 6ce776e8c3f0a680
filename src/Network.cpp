/**
 * @file Network.cpp
 * @brief Network definitions for both states.
 */

#include "veritas/Network.hpp"
#include "veritas/Errors.hpp"

#include <fstream>

namespace veritas::nn
{

namespace
{

nlohmann::json neuron_to_json(const Neuron& neuron)
{
    nlohmann::json j;
    j["weights"] = neuron.get_weights();
    j["bias"] = neuron.get_bias();
    j["output"] = neuron.get_output();
    return j;
}

nlohmann::json layer_to_json(const Layer& layer)
{
    nlohmann::json neurons = nlohmann::json::array();
    for (const Neuron& neuron : layer.get_neurons())
    {
        neurons.push_back(neuron_to_json(neuron));
    }

    nlohmann::json j;
    j["neurons"] = std::move(neurons);
    j["function"] = ml::to_string(layer.get_activation());
    return j;
}

Neuron neuron_from_json(const nlohmann::json& j)
{
    std::vector<double> weights = j.at("weights").get<std::vector<double>>();
    const double bias = j.at("bias").get<double>();

    double output = 0.0;
    if (j.contains("output"))
    {
        output = j.at("output").get<double>();
    }

    return Neuron(std::move(weights), bias, output);
}

Layer layer_from_json(const nlohmann::json& j, uint64_t input_size)
{
    const nlohmann::json& neurons_json = j.at("neurons");
    VERITAS_CHECK(!neurons_json.is_array(),
        format_error,
        R"(from_json: "neurons" must be an array.)");

    std::vector<Neuron> neurons;
    neurons.reserve(neurons_json.size());
    for (const nlohmann::json& neuron_json : neurons_json)
    {
        neurons.push_back(neuron_from_json(neuron_json));
    }

    const ml::Activation activation =
        ml::activation_from_string(j.at("function").get<std::string>());

    return Layer(input_size, std::move(neurons), activation);
}

} // namespace

Network<Building>::Network(uint64_t input_size)
    : m_input_size(input_size)
{
    VERITAS_CHECK(input_size == 0,
        validation_error,
        R"(Network: input size must be positive.)");
}

Network<Building> Network<Building>::add_layer(uint64_t size,
    ml::Activation activation) &&
{
    m_layers.emplace_back(get_output_size(), size, activation);
    return std::move(*this);
}

Network<Ready> Network<Building>::build(ml::Cost cost) &&
{
    return Network<Ready>(m_input_size, std::move(m_layers), cost);
}

uint64_t Network<Building>::get_output_size() const
{
    if (m_layers.empty())
    {
        return m_input_size;
    }
    return m_layers.back().get_size();
}

Network<Ready>::Network(uint64_t input_size,
    std::vector<Layer> layers,
    ml::Cost cost)
    : m_input_size(input_size),
      m_layers(std::move(layers)),
      m_cost(cost)
{
    VERITAS_CHECK(input_size == 0,
        validation_error,
        R"(Network: input size must be positive.)");

    uint64_t width = m_input_size;
    for (uint64_t l = 0; l < m_layers.size(); ++l)
    {
        VERITAS_CHECK(m_layers[l].get_input_size() != width,
            dimension_error,
            "Network: layer " + std::to_string(l) + " expects " +
            std::to_string(m_layers[l].get_input_size()) +
            " inputs but receives " + std::to_string(width) + ".");
        width = m_layers[l].get_size();
    }
}

std::pair<data::Label, std::vector<double>>
Network<Ready>::run(const data::Datapoint& datapoint)
{
    VERITAS_CHECK(datapoint.inputs().size() != m_input_size,
        dimension_error,
        "run: network expects " + std::to_string(m_input_size) +
        " inputs, got " + std::to_string(datapoint.inputs().size()) + ".");

    std::vector<double> values = datapoint.inputs();
    for (Layer& layer : m_layers)
    {
        values = layer.forward(values);
    }

    const data::Label label = data::label_from(values);
    return {label, std::move(values)};
}

double Network<Ready>::cost(const data::Dataset& dataset)
{
    VERITAS_CHECK(dataset.empty(),
        validation_error,
        R"(cost: dataset has no datapoints.)");

    double total = 0.0;
    for (const data::Datapoint& datapoint : dataset)
    {
        const std::vector<double> outputs = run(datapoint).second;
        total += ml::apply(m_cost, outputs, datapoint.targets());
    }

    return total / static_cast<double>(dataset.size());
}

void Network<Ready>::mutate(double alpha)
{
    for (Layer& layer : m_layers)
    {
        layer.mutate(alpha);
    }
}

uint64_t Network<Ready>::get_output_size() const
{
    if (m_layers.empty())
    {
        return m_input_size;
    }
    return m_layers.back().get_size();
}

nlohmann::json Network<Ready>::to_json() const
{
    nlohmann::json layers = nlohmann::json::array();
    for (const Layer& layer : m_layers)
    {
        layers.push_back(layer_to_json(layer));
    }

    nlohmann::json j;
    j["input_size"] = m_input_size;
    j["layers"] = std::move(layers);
    j["cost_function"] = ml::to_string(m_cost);
    j["marker"] = nullptr;
    return j;
}

Network<Ready> Network<Ready>::from_json(const nlohmann::json& j)
{
    try
    {
        const uint64_t input_size = j.at("input_size").get<uint64_t>();

        const nlohmann::json& layers_json = j.at("layers");
        VERITAS_CHECK(!layers_json.is_array(),
            format_error,
            R"(from_json: "layers" must be an array.)");

        std::vector<Layer> layers;
        layers.reserve(layers_json.size());
        uint64_t width = input_size;
        for (const nlohmann::json& layer_json : layers_json)
        {
            layers.push_back(layer_from_json(layer_json, width));
            width = layers.back().get_size();
        }

        const ml::Cost cost =
            ml::cost_from_string(j.at("cost_function").get<std::string>());

        return Network<Ready>(input_size, std::move(layers), cost);
    }
    catch (const nlohmann::json::exception& e)
    {
        throw format_error(std::string("from_json: ") + e.what());
    }
    catch (const std::invalid_argument& e)
    {
        throw format_error(std::string("from_json: ") + e.what());
    }
}

void Network<Ready>::serialize(const std::string& path) const
{
    std::ofstream file(path);
    VERITAS_CHECK(!file,
        io_error,
        "serialize: cannot open '" + path + "' for writing.");

    file << to_json().dump();

    VERITAS_CHECK(!file,
        io_error,
        "serialize: failed writing '" + path + "'.");
}

Network<Ready> Network<Ready>::deserialize(const std::string& path)
{
    std::ifstream file(path);
    VERITAS_CHECK(!file,
        io_error,
        "deserialize: cannot open '" + path + "'.");

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw format_error("deserialize: '" + path + "': " + e.what());
    }

    return from_json(j);
}

} // namespace veritas::nn
