/**
 * @file Image.cpp
 * @brief Pixel buffer codec definitions.
 */

#include "veritas/Image.hpp"
#include "veritas/Errors.hpp"

#include <cmath>

namespace veritas::image
{

namespace
{

uint8_t to_channel(double value)
{
    const double scaled = value * 255.0;
    if (!(scaled > 0.0))
    {
        return 0;
    }
    if (scaled >= 255.0)
    {
        return 255;
    }
    return static_cast<uint8_t>(scaled);
}

} // namespace

data::Datapoint encode(const PixelBuffer& buffer)
{
    const uint64_t expected = buffer.width * buffer.height * CHANNEL_COUNT;
    VERITAS_CHECK(buffer.pixels.size() != expected,
        validation_error,
        "encode: expected " + std::to_string(expected) +
        " channel bytes, got " + std::to_string(buffer.pixels.size()) + ".");

    std::vector<double> inputs;
    inputs.reserve(expected);
    for (uint8_t channel : buffer.pixels)
    {
        inputs.push_back(static_cast<double>(channel) / 256.0);
    }

    return data::Datapoint(std::move(inputs), data::Label::Real);
}

std::pair<uint64_t, uint64_t> image_dimensions(uint64_t pixel_count)
{
    VERITAS_CHECK(pixel_count == 0,
        validation_error,
        R"(image_dimensions: pixel count must be positive.)");

    const double root = std::sqrt(static_cast<double>(pixel_count));
    uint64_t width = static_cast<uint64_t>(std::floor(root));
    uint64_t height = static_cast<uint64_t>(std::ceil(root));

    while (width * height != pixel_count)
    {
        if (width * height > pixel_count)
        {
            height -= 1;
        }
        else
        {
            width += 1;
        }
    }

    return {width, height};
}

PixelBuffer decode(const data::Datapoint& datapoint)
{
    const std::vector<double>& inputs = datapoint.inputs();

    VERITAS_CHECK(inputs.empty(),
        validation_error,
        R"(decode: datapoint has no inputs.)");

    VERITAS_CHECK(inputs.size() % CHANNEL_COUNT != 0,
        validation_error,
        "decode: input length " + std::to_string(inputs.size()) +
        " is not a multiple of " + std::to_string(CHANNEL_COUNT) + ".");

    const auto [width, height] =
        image_dimensions(inputs.size() / CHANNEL_COUNT);

    PixelBuffer buffer;
    buffer.width = width;
    buffer.height = height;
    buffer.pixels.resize(inputs.size());

    for (uint64_t y = 0; y < height; ++y)
    {
        for (uint64_t x = 0; x < width; ++x)
        {
            const uint64_t index = (x + y * width) * CHANNEL_COUNT;
            for (uint64_t c = 0; c < CHANNEL_COUNT; ++c)
            {
                buffer.pixels[index + c] = to_channel(inputs[index + c]);
            }
        }
    }

    return buffer;
}

} // namespace veritas::image
