/**
 * @file Label.hpp
 * @brief Classification labels and their one-hot encoding.
 */

#ifndef VERITAS_LABEL_HPP
#define VERITAS_LABEL_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace veritas::data
{

/**
 * @brief Class of an image.
 */
enum class Label
{
    Real,   ///< One-hot [1, 0]
    Fake    ///< One-hot [0, 1]
};

/// Number of labels; also the output width of a classification network.
constexpr uint64_t LABEL_COUNT = 2;

/**
 * @brief Derive a label from a network output vector.
 *
 * Picks the index of the largest value; on ties the earliest index wins.
 * Index 0 maps to Real, every other index to Fake.
 *
 * @param outputs Output vector of length LABEL_COUNT.
 * @throws dimension_error If @p outputs.size() != LABEL_COUNT.
 */
Label label_from(const std::vector<double>& outputs);

/**
 * @brief One-hot target vector of a label.
 */
std::vector<double> one_hot(Label label);

/// "Real" or "Fake".
std::string to_string(Label label);

} // namespace veritas::data

#endif // VERITAS_LABEL_HPP
