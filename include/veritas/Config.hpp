/**
 * @file Config.hpp
 * @brief Locations of the persisted network and of the image to classify.
 */

#ifndef VERITAS_CONFIG_HPP
#define VERITAS_CONFIG_HPP

#include <string>

#include <nlohmann/json.hpp>

namespace veritas::config
{

/// Path used when no configuration file is given on the command line.
inline constexpr const char* DEFAULT_CONFIG_PATH = "./config/config.json";

/**
 * @brief Paths read from the configuration file.
 */
struct Config
{
    std::string settings_path {};   ///< Serialized network.
    std::string test_path {};       ///< Image to classify.
};

/**
 * @brief Build a Config from its JSON form.
 *
 * @throws format_error If a key is missing or is not a string.
 */
Config parse(const nlohmann::json& j);

/**
 * @brief Read and parse a configuration file.
 *
 * @throws io_error If the file cannot be opened.
 * @throws format_error If the content is malformed.
 */
Config load(const std::string& path = DEFAULT_CONFIG_PATH);

} // namespace veritas::config

#endif // VERITAS_CONFIG_HPP
