/**
 * @file ML.cpp
 * @brief Activation and cost function definitions.
 */

#include "veritas/ML.hpp"
#include "veritas/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace veritas::ml
{

std::vector<double> apply(Activation activation,
    const std::vector<double>& values)
{
    std::vector<double> out;
    out.reserve(values.size());

    switch (activation)
    {
    case Activation::Linear:
        out = values;
        break;

    case Activation::ReLU:
        for (double v : values)
        {
            out.push_back(std::max(0.0, v));
        }
        break;

    case Activation::Sigmoid:
        for (double v : values)
        {
            out.push_back(1.0 / (1.0 + std::exp(-v)));
        }
        break;

    case Activation::Softmax:
    {
        double partition = 0.0;
        for (double v : values)
        {
            partition += std::exp(v);
        }
        for (double v : values)
        {
            out.push_back(std::exp(v) / partition);
        }
        break;
    }
    }

    return out;
}

double apply(Cost cost,
    const std::vector<double>& outputs,
    const std::vector<double>& targets)
{
    VERITAS_CHECK(outputs.size() != targets.size(),
        dimension_error,
        "cost: outputs has " + std::to_string(outputs.size()) +
        " values but targets has " + std::to_string(targets.size()) + ".");

    VERITAS_CHECK(outputs.empty(),
        validation_error,
        R"(cost: outputs must not be empty.)");

    double result = 0.0;

    switch (cost)
    {
    case Cost::MeanSquaredError:
    {
        for (uint64_t i = 0; i < outputs.size(); ++i)
        {
            const double diff = targets[i] - outputs[i];
            result += diff * diff;
        }
        result /= static_cast<double>(outputs.size());
        break;
    }

    case Cost::CategoricalCrossEntropy:
    {
        const std::vector<double> probs = apply(Activation::Softmax, outputs);
        double summed = 0.0;
        for (uint64_t i = 0; i < probs.size(); ++i)
        {
            summed += targets[i] * std::log(probs[i]);
        }
        result = -summed;
        break;
    }
    }

    return result;
}

std::string to_string(Activation activation)
{
    switch (activation)
    {
    case Activation::Linear:  return "Linear";
    case Activation::ReLU:    return "ReLU";
    case Activation::Sigmoid: return "Sigmoid";
    case Activation::Softmax: return "Softmax";
    }
    throw validation_error(R"(to_string: unknown activation.)");
}

std::string to_string(Cost cost)
{
    switch (cost)
    {
    case Cost::MeanSquaredError:        return "MSE";
    case Cost::CategoricalCrossEntropy: return "CCE";
    }
    throw validation_error(R"(to_string: unknown cost.)");
}

Activation activation_from_string(const std::string& tag)
{
    if (tag == "Linear")  return Activation::Linear;
    if (tag == "ReLU")    return Activation::ReLU;
    if (tag == "Sigmoid") return Activation::Sigmoid;
    if (tag == "Softmax") return Activation::Softmax;
    throw validation_error("activation_from_string: unknown tag '" +
        tag + "'.");
}

Cost cost_from_string(const std::string& tag)
{
    if (tag == "MSE") return Cost::MeanSquaredError;
    if (tag == "CCE") return Cost::CategoricalCrossEntropy;
    throw validation_error("cost_from_string: unknown tag '" + tag + "'.");
}

} // namespace veritas::ml
