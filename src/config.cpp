#include "mqttident/config.hpp"

#include "mqttident/json.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace mqttident {
namespace config {

Result<ConnectionOptions> parse_connection_options(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return Result<ConnectionOptions>::error(ErrorCode::ParseError,
                                                    "Configuration must be a JSON object");
        }
        return Result<ConnectionOptions>::ok(json::parse_connection_options(j));
    } catch (const nlohmann::json::exception& e) {
        return Result<ConnectionOptions>::error(ErrorCode::ParseError,
                                                std::string("Invalid configuration: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return Result<ConnectionOptions>::error(ErrorCode::ParseError,
                                                std::string("Invalid configuration: ") + e.what());
    }
}

Result<ConnectionOptions> load_connection_options(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<ConnectionOptions>::error(ErrorCode::FileNotFound,
                                                "Configuration file not found: " + path);
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return Result<ConnectionOptions>::error(ErrorCode::FileError,
                                                "Cannot open configuration file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<ConnectionOptions>::error(ErrorCode::FileError,
                                                "Cannot read configuration file: " + path);
    }

    return parse_connection_options(content);
}

}  // namespace config
}  // namespace mqttident
