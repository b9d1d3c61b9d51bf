#pragma once

/**
 * @file identity.hpp
 * @brief Fingerprint selection and client identifier composition
 */

#include "mqttident/events.hpp"
#include "mqttident/mqttident.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mqttident {

/// Supplies device facts on demand (default: facts::collect_device_facts)
using FactCollector = std::function<DeviceFacts()>;

/// Supplies the hostname used as the last-resort fingerprint
using HostnameProvider = std::function<std::optional<std::string>()>;

/**
 * @brief Validate an identity component (app name, instance id)
 *
 * @param value Raw value; surrounding whitespace is ignored
 * @param field_name Name used in the error message
 * @return The trimmed value lowercased, or InvalidComponent when it is empty
 *         or contains anything but ASCII letters, digits and '-'
 */
[[nodiscard]] Result<std::string> validate_component(const std::string& value,
                                                     const std::string& field_name);

/**
 * @brief Pick the most trustworthy stable value as "<kind>:<value>"
 *
 * Priority: serial number ("sn:"), then the connection with the lowest
 * (kind rank, address) where mac < bluetooth < anything else, then the
 * hostname ("host:"), then "host:unknown". Never fails.
 */
[[nodiscard]] std::string resolve_device_fingerprint(const std::optional<std::string>& serial_number,
                                                     const std::vector<Connection>& connections);

/// Same, with an explicit hostname source for the fallback
[[nodiscard]] std::string resolve_device_fingerprint(const std::optional<std::string>& serial_number,
                                                     const std::vector<Connection>& connections,
                                                     const HostnameProvider& hostname);

/**
 * @brief Inputs of build_auto_client_id
 *
 * When both `serial_number` and `connections` are unset the fact collector
 * runs; otherwise the supplied facts are used as-is.
 */
struct ClientIdRequest {
    std::string app_name;
    std::optional<std::string> instance_id;
    int max_length = DEFAULT_MAX_CLIENT_ID_LENGTH;
    std::optional<std::string> serial_number;
    std::optional<std::vector<Connection>> connections;
};

/**
 * @brief Derive a deterministic MQTT client identifier
 *
 * The result is at most `max_length` characters, either a bare hash suffix
 * or "<app-prefix>-<suffix>", over [a-z0-9-].
 *
 * @param request Identity inputs
 * @param collector Fact source used when the request carries no facts;
 *        an empty function selects the live probe
 * @param events Optional diagnostic sink
 * @return The identifier, or InvalidComponent / InvalidConfiguration /
 *         DigestError
 */
[[nodiscard]] Result<std::string> build_auto_client_id(const ClientIdRequest& request,
                                                       const FactCollector& collector = nullptr,
                                                       EventBus* events = nullptr);

/// Positional form of build_auto_client_id using the live fact probe
[[nodiscard]] Result<std::string> build_auto_client_id(
    const std::string& app_name, const std::optional<std::string>& instance_id = std::nullopt,
    int max_length = DEFAULT_MAX_CLIENT_ID_LENGTH,
    const std::optional<std::string>& serial_number = std::nullopt,
    const std::optional<std::vector<Connection>>& connections = std::nullopt);

}  // namespace mqttident
