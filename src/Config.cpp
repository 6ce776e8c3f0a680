/**
 * @file Config.cpp
 * @brief Configuration loading definitions.
 */

#include "veritas/Config.hpp"
#include "veritas/Errors.hpp"

#include <fstream>

namespace veritas::config
{

Config parse(const nlohmann::json& j)
{
    try
    {
        Config config;
        config.settings_path = j.at("settings_path").get<std::string>();
        config.test_path = j.at("test_path").get<std::string>();
        return config;
    }
    catch (const nlohmann::json::exception& e)
    {
        throw format_error(std::string("config: ") + e.what());
    }
}

Config load(const std::string& path)
{
    std::ifstream file(path);
    VERITAS_CHECK(!file,
        io_error,
        "config: cannot open '" + path + "'.");

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw format_error("config: '" + path + "': " + e.what());
    }

    return parse(j);
}

} // namespace veritas::config
