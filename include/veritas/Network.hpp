/**
 * @file Network.hpp
 * @brief Feedforward network with a build-time and a run-time state.
 *
 * A Network<Building> only grows layers; build() consumes it and yields
 * a Network<Ready>, whose topology can no longer change but which can be
 * run, scored, mutated and persisted.
 *
 * Usage:
 *   Network<Ready> net = Network<Building>(64 * 64 * 4)
 *       .add_layer(64, ml::Activation::Sigmoid)
 *       .add_layer(2, ml::Activation::Sigmoid)
 *       .build(ml::Cost::MeanSquaredError);
 */

#ifndef VERITAS_NETWORK_HPP
#define VERITAS_NETWORK_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "Datapoint.hpp"
#include "Label.hpp"
#include "ML.hpp"
#include "NN.hpp"

namespace veritas::nn
{

/// State tag: layers may still be added.
struct Building {};

/// State tag: topology frozen, network can be evaluated.
struct Ready {};

/**
 * @brief Class template for a feedforward network.
 * @tparam State Building or Ready.
 *
 * Only the two specializations below exist.
 */
template <typename State>
class Network;

/**
 * @brief Network under construction.
 *
 * Every added layer takes the current output width as its input width,
 * so adjacent layers always agree on their shared width.
 */
template <>
class Network<Building>
{

private:

    /// Member width of the input vectors.
    uint64_t           m_input_size {0};

    /// Member layers, in forward order.
    std::vector<Layer> m_layers {};

    /// Member cost, replaced by build().
    ml::Cost           m_cost {ml::Cost::MeanSquaredError};

public:

    /**
     * @brief Start a network with no layers.
     *
     * @param input_size Width of the input vectors (must be > 0).
     * @throws validation_error If @p input_size is zero.
     */
    explicit Network(uint64_t input_size);

    /**
     * @brief Append a layer of @p size randomly initialized neurons.
     *
     * Consumes the builder; chain the calls or std::move a named one.
     *
     * @throws validation_error If @p size is zero.
     */
    Network<Building> add_layer(uint64_t size,
        ml::Activation activation = ml::Activation::Linear) &&;

    /**
     * @brief Freeze the topology and fix the cost function.
     */
    Network<Ready> build(ml::Cost cost = ml::Cost::MeanSquaredError) &&;

    uint64_t get_input_size() const { return m_input_size; }

    /// Size of the last layer, or the input size if there are no layers.
    uint64_t get_output_size() const;

    uint64_t get_layer_count() const { return m_layers.size(); }
};

/**
 * @brief Network ready to run.
 */
template <>
class Network<Ready> : public Genetic
{

private:

    /// Member width of the input vectors.
    uint64_t           m_input_size {0};

    /// Member layers, in forward order.
    std::vector<Layer> m_layers {};

    /// Member cost used by cost().
    ml::Cost           m_cost {ml::Cost::MeanSquaredError};

    /**
     * @brief Assemble a ready network.
     *
     * @throws dimension_error If the layer widths do not chain from
     * @p input_size.
     */
    Network(uint64_t input_size, std::vector<Layer> layers, ml::Cost cost);

    friend class Network<Building>;

public:

    /**
     * @brief Forward a datapoint through every layer.
     *
     * Overwrites each neuron's memoized output.
     *
     * @return The label derived from the final vector, and the vector.
     * @throws dimension_error If the input width or the final width
     * does not match.
     * @throws nan_error If the inputs contain NaN.
     */
    std::pair<data::Label, std::vector<double>>
    run(const data::Datapoint& datapoint);

    /**
     * @brief Mean cost of the network over a dataset.
     *
     * Each datapoint's output is compared with its one-hot target.
     *
     * @throws validation_error If @p dataset is empty.
     */
    double cost(const data::Dataset& dataset);

    void mutate(double alpha) override;

    /// Full state as JSON.
    nlohmann::json to_json() const;

    /**
     * @brief Rebuild a network from to_json() output.
     *
     * @throws format_error If fields are missing, have the wrong type,
     * carry unknown tags or do not describe a consistent topology.
     */
    static Network<Ready> from_json(const nlohmann::json& j);

    /**
     * @brief Write the network to @p path as JSON.
     *
     * @throws io_error If the file cannot be written.
     */
    void serialize(const std::string& path) const;

    /**
     * @brief Read a network written by serialize().
     *
     * @throws io_error If the file cannot be opened.
     * @throws format_error If the content is malformed.
     */
    static Network<Ready> deserialize(const std::string& path);

    uint64_t get_input_size() const { return m_input_size; }

    /// Size of the last layer, or the input size if there are no layers.
    uint64_t get_output_size() const;

    const std::vector<Layer>& get_layers() const { return m_layers; }

    ml::Cost get_cost() const { return m_cost; }
};

} // namespace veritas::nn

#endif // VERITAS_NETWORK_HPP
