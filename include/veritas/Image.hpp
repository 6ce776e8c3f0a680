/**
 * @file Image.hpp
 * @brief Conversion between RGBA pixel buffers and datapoints.
 *
 * Image file formats are not handled here; callers decode files into a
 * PixelBuffer first.
 */

#ifndef VERITAS_IMAGE_HPP
#define VERITAS_IMAGE_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include "Datapoint.hpp"

namespace veritas::image
{

/// Number of channels per pixel (R, G, B, A).
constexpr uint64_t CHANNEL_COUNT = 4;

/**
 * @brief Decoded RGBA8 image, row-major, channel-interleaved.
 */
struct PixelBuffer
{
    uint64_t             width {0};   ///< Pixels per row.
    uint64_t             height {0};  ///< Number of rows.
    std::vector<uint8_t> pixels {};   ///< width * height * 4 bytes.
};

/**
 * @brief Encode a pixel buffer as a datapoint.
 *
 * Every channel byte is divided by 256, so inputs lie in [0, 1). The
 * label is Real; labeling is up to the caller.
 *
 * @throws validation_error If pixels.size() != width * height * 4.
 */
data::Datapoint encode(const PixelBuffer& buffer);

/**
 * @brief Decode a datapoint back into a pixel buffer.
 *
 * Dimensions come from image_dimensions(); channels are scaled by 255
 * and truncated, saturating outside [0, 255].
 *
 * @throws validation_error If the input length is zero or not a multiple
 * of CHANNEL_COUNT.
 */
PixelBuffer decode(const data::Datapoint& datapoint);

/**
 * @brief Find the width and height closest to a square for a pixel count.
 *
 * Starts from floor(sqrt(n)) x ceil(sqrt(n)) and shrinks the height or
 * grows the width until the product equals @p pixel_count.
 *
 * @return {width, height}.
 * @throws validation_error If @p pixel_count is zero.
 */
std::pair<uint64_t, uint64_t> image_dimensions(uint64_t pixel_count);

} // namespace veritas::image

#endif // VERITAS_IMAGE_HPP
