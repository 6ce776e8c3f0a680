/**
 * @file veritas_classify.cpp
 * @brief Classify one image with a persisted network.
 *
 * Usage:
 *   veritas_classify [config_path]
 *   veritas_classify --create <network_path>
 */

#include <stb_image.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "veritas/Config.hpp"
#include "veritas/Errors.hpp"
#include "veritas/Image.hpp"
#include "veritas/Label.hpp"
#include "veritas/Network.hpp"

using namespace veritas;

namespace
{

/// Side of the square images the default network classifies.
constexpr uint64_t IMAGE_SIDE = 64;

image::PixelBuffer load_pixels(const std::string& path)
{
    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* p_data = stbi_load(path.c_str(), &width, &height, &channels,
        static_cast<int>(image::CHANNEL_COUNT));

    if (p_data == nullptr)
    {
        const char* reason = stbi_failure_reason();
        throw io_error("load_pixels: cannot decode '" + path + "': " +
            (reason != nullptr ? reason : "unknown reason"));
    }

    image::PixelBuffer buffer;
    buffer.width = static_cast<uint64_t>(width);
    buffer.height = static_cast<uint64_t>(height);
    buffer.pixels.assign(p_data,
        p_data + buffer.width * buffer.height * image::CHANNEL_COUNT);
    stbi_image_free(p_data);

    return buffer;
}

nn::Network<nn::Ready> create_network()
{
    return nn::Network<nn::Building>(IMAGE_SIDE * IMAGE_SIDE *
            image::CHANNEL_COUNT)
        .add_layer(64, ml::Activation::Sigmoid)
        .add_layer(64, ml::Activation::Sigmoid)
        .add_layer(64, ml::Activation::Sigmoid)
        .add_layer(data::LABEL_COUNT, ml::Activation::Sigmoid)
        .build(ml::Cost::MeanSquaredError);
}

std::string format_outputs(const std::vector<double>& outputs)
{
    std::ostringstream os;
    os << "[";
    for (uint64_t i = 0; i < outputs.size(); ++i)
    {
        if (i > 0)
        {
            os << ", ";
        }
        os << outputs[i];
    }
    os << "]";
    return os.str();
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        if (argc == 3 && std::string(argv[1]) == "--create")
        {
            create_network().serialize(argv[2]);
            std::cout << "Network written to " << argv[2] << std::endl;
            return EXIT_SUCCESS;
        }

        std::string config_path = config::DEFAULT_CONFIG_PATH;
        if (argc >= 2)
        {
            config_path = argv[1];
        }

        const config::Config cfg = config::load(config_path);

        const data::Datapoint datapoint =
            image::encode(load_pixels(cfg.test_path));
        nn::Network<nn::Ready> network =
            nn::Network<nn::Ready>::deserialize(cfg.settings_path);

        const auto [label, outputs] = network.run(datapoint);

        std::cout << "Label: " << data::to_string(label)
                  << ", Outputs: " << format_outputs(outputs) << std::endl;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
