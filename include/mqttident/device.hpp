#pragma once

/**
 * @file device.hpp
 * @brief Platform detection and access to raw device data
 *
 * FactSource is the only way the fact probe touches the system. The live
 * implementation reads files, runs diagnostic commands and queries platform
 * APIs; MemoryFactSource serves canned data for tests and fixtures.
 */

#include "mqttident/process.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mqttident {
namespace device {

/// Runtime families with a dedicated probe
enum class Platform { Embedded, Linux, Darwin, Windows, Unknown };

/// Convert platform to string
[[nodiscard]] constexpr const char* platform_to_string(Platform platform) noexcept {
    switch (platform) {
        case Platform::Embedded:
            return "embedded";
        case Platform::Linux:
            return "linux";
        case Platform::Darwin:
            return "darwin";
        case Platform::Windows:
            return "windows";
        case Platform::Unknown:
            return "unknown";
    }
    return "unknown";
}

/**
 * @brief Detect the platform this binary runs on
 *
 * A constrained-runtime build (ESP-IDF, Arduino, Zephyr) wins over the host
 * OS family. Anything unrecognized is Platform::Unknown.
 */
[[nodiscard]] Platform detect_platform() noexcept;

/// Get the platform name: "embedded", "linux", "darwin", "windows" or "unknown"
[[nodiscard]] std::string get_platform_name();

/**
 * @brief Get the system hostname
 *
 * @return The hostname, or nullopt when it cannot be determined
 */
[[nodiscard]] std::optional<std::string> get_hostname();

/**
 * @brief Source of raw device data consulted by the fact probe
 *
 * Every accessor is best-effort and reports "absent" as nullopt or an empty
 * container; none of them throws.
 */
class FactSource {
  public:
    virtual ~FactSource() = default;

    /// Read a whole file
    [[nodiscard]] virtual std::optional<std::string> read_file(const std::string& path) = 0;

    /// List entry names (not paths) of a directory; nullopt if it does not exist
    [[nodiscard]] virtual std::optional<std::vector<std::string>> list_directory(
        const std::string& path) = 0;

    /// Run a fixed-argument command and return stdout if it succeeded
    [[nodiscard]] virtual std::optional<std::string> run_command(
        const std::vector<std::string>& argv) = 0;

    /// Query a string property of the platform registry (IOKit on macOS)
    [[nodiscard]] virtual std::optional<std::string> registry_property(const std::string& key) = 0;

    /// Factory-programmed unique id of an embedded board
    [[nodiscard]] virtual std::optional<std::vector<uint8_t>> board_unique_id() = 0;

    /// Raw interface MACs reported by an embedded network stack
    [[nodiscard]] virtual std::vector<std::vector<uint8_t>> board_interface_macs() = 0;
};

/**
 * @brief FactSource backed by the running system
 */
class SystemFactSource : public FactSource {
  public:
    explicit SystemFactSource(
        std::chrono::milliseconds command_timeout = process::DEFAULT_COMMAND_TIMEOUT);

    [[nodiscard]] std::optional<std::string> read_file(const std::string& path) override;
    [[nodiscard]] std::optional<std::vector<std::string>> list_directory(
        const std::string& path) override;
    [[nodiscard]] std::optional<std::string> run_command(
        const std::vector<std::string>& argv) override;
    [[nodiscard]] std::optional<std::string> registry_property(const std::string& key) override;
    [[nodiscard]] std::optional<std::vector<uint8_t>> board_unique_id() override;
    [[nodiscard]] std::vector<std::vector<uint8_t>> board_interface_macs() override;

    [[nodiscard]] std::chrono::milliseconds command_timeout() const noexcept {
        return command_timeout_;
    }

  private:
    std::chrono::milliseconds command_timeout_;
};

/**
 * @brief In-memory FactSource (for tests or replaying captured facts)
 *
 * Directories are implied by file paths: a file at "/sys/class/net/eth0/address"
 * makes "eth0" an entry of "/sys/class/net".
 */
class MemoryFactSource : public FactSource {
  public:
    void set_file(const std::string& path, std::string content);
    void set_command_output(const std::vector<std::string>& argv, std::string output);
    void set_registry_property(const std::string& key, std::string value);
    void set_board_unique_id(std::vector<uint8_t> id);
    void add_board_interface_mac(std::vector<uint8_t> mac);

    [[nodiscard]] std::optional<std::string> read_file(const std::string& path) override;
    [[nodiscard]] std::optional<std::vector<std::string>> list_directory(
        const std::string& path) override;
    [[nodiscard]] std::optional<std::string> run_command(
        const std::vector<std::string>& argv) override;
    [[nodiscard]] std::optional<std::string> registry_property(const std::string& key) override;
    [[nodiscard]] std::optional<std::vector<uint8_t>> board_unique_id() override;
    [[nodiscard]] std::vector<std::vector<uint8_t>> board_interface_macs() override;

    /// Commands that were requested, in order
    [[nodiscard]] const std::vector<std::vector<std::string>>& command_log() const noexcept {
        return command_log_;
    }

  private:
    std::map<std::string, std::string> files_;
    std::map<std::vector<std::string>, std::string> commands_;
    std::map<std::string, std::string> registry_;
    std::optional<std::vector<uint8_t>> board_unique_id_;
    std::vector<std::vector<uint8_t>> board_macs_;
    std::vector<std::vector<std::string>> command_log_;
};

}  // namespace device
}  // namespace mqttident
