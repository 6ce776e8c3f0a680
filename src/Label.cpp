/**
 * @file Label.cpp
 * @brief Label derivation and encoding definitions.
 */

#include "veritas/Label.hpp"
#include "veritas/Errors.hpp"

namespace veritas::data
{

Label label_from(const std::vector<double>& outputs)
{
    VERITAS_CHECK(outputs.size() != LABEL_COUNT,
        dimension_error,
        "label_from: expected " + std::to_string(LABEL_COUNT) +
        " outputs, got " + std::to_string(outputs.size()) + ".");

    uint64_t best = 0;
    for (uint64_t i = 1; i < outputs.size(); ++i)
    {
        if (outputs[i] > outputs[best])
        {
            best = i;
        }
    }

    if (best == 0)
    {
        return Label::Real;
    }
    return Label::Fake;
}

std::vector<double> one_hot(Label label)
{
    switch (label)
    {
    case Label::Real: return {1.0, 0.0};
    case Label::Fake: return {0.0, 1.0};
    }
    throw validation_error(R"(one_hot: unknown label.)");
}

std::string to_string(Label label)
{
    switch (label)
    {
    case Label::Real: return "Real";
    case Label::Fake: return "Fake";
    }
    throw validation_error(R"(to_string: unknown label.)");
}

} // namespace veritas::data
