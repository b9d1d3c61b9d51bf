#pragma once

/**
 * @file config.hpp
 * @brief Loading connection options from JSON
 */

#include "mqttident/connection.hpp"
#include "mqttident/mqttident.hpp"

#include <string>

namespace mqttident {
namespace config {

/**
 * @brief Parse connection options from a JSON document
 *
 * @return Options, or ParseError for malformed JSON, missing required keys,
 *         wrong value types or unknown enum values
 */
[[nodiscard]] Result<ConnectionOptions> parse_connection_options(const std::string& text);

/**
 * @brief Load connection options from a JSON file
 *
 * @return Options, or FileNotFound / FileError / ParseError
 */
[[nodiscard]] Result<ConnectionOptions> load_connection_options(const std::string& path);

}  // namespace config
}  // namespace mqttident
