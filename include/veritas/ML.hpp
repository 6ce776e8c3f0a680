/**
 * @file ML.hpp
 * @brief Activation and cost functions.
 *
 * Both families are closed sets: each is an enumeration dispatched by a
 * single exhaustive apply function.
 */

#ifndef VERITAS_ML_HPP
#define VERITAS_ML_HPP

#include <string>
#include <vector>

namespace veritas::ml
{

/**
 * @brief Activation applied by a layer to its vector of weighted sums.
 */
enum class Activation
{
    Linear,     ///< Identity (default)
    ReLU,       ///< max(0, x)
    Sigmoid,    ///< 1 / (1 + exp(-x))
    Softmax     ///< exp(x_i) / sum_j exp(x_j) over the whole vector
};

/**
 * @brief Cost comparing a network output against a target vector.
 */
enum class Cost
{
    MeanSquaredError,       ///< Default
    CategoricalCrossEntropy ///< Cross-entropy of softmax(outputs)
};

/**
 * @brief Apply an activation to a vector of pre-activation values.
 *
 * The result has the same length as @p values. Softmax normalizes over
 * the whole vector and does not subtract the maximum before
 * exponentiating, so very large inputs overflow to inf/NaN. NaN is not
 * propagated: the next Layer::forward rejects it with nan_error, so a
 * network whose hidden layer overflows makes run() and cost() throw
 * rather than yield a label or a NaN score.
 *
 * @param activation Activation kind.
 * @param values Pre-activation values.
 * @return The activated vector.
 */
std::vector<double> apply(Activation activation,
    const std::vector<double>& values);

/**
 * @brief Compute the loss between outputs and targets.
 *
 * - MeanSquaredError: sum((target - output)^2) / len(outputs).
 * - CategoricalCrossEntropy: -sum(target * ln(softmax(outputs))).
 *   Softmax is applied here, so @p outputs must be raw layer outputs.
 *
 * @param cost Cost kind.
 * @param outputs Network outputs. Must not be empty.
 * @param targets Target values, same length as @p outputs.
 *
 * @throws dimension_error If the lengths differ.
 * @throws validation_error If @p outputs is empty.
 */
double apply(Cost cost,
    const std::vector<double>& outputs,
    const std::vector<double>& targets);

/// Persisted tag of an activation ("Linear", "ReLU", "Sigmoid", "Softmax").
std::string to_string(Activation activation);

/// Persisted tag of a cost ("MSE", "CCE").
std::string to_string(Cost cost);

/**
 * @brief Parse a persisted activation tag.
 * @throws validation_error For an unknown tag.
 */
Activation activation_from_string(const std::string& tag);

/**
 * @brief Parse a persisted cost tag.
 * @throws validation_error For an unknown tag.
 */
Cost cost_from_string(const std::string& tag);

} // namespace veritas::ml

#endif // VERITAS_ML_HPP
