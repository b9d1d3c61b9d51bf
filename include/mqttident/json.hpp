#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization of mqttident types
 *
 * Uses nlohmann/json. Parse helpers ignore unknown keys; a key of the wrong
 * type throws nlohmann::json::exception and an out-of-range enum value throws
 * std::invalid_argument.
 */

#include "mqttident/connection.hpp"
#include "mqttident/mqttident.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace mqttident {
namespace json {

using nlohmann::json;

// ==================== Enums ====================

/// Parse "v311"/"3.1.1"/"v3" or "v5"/"5"
[[nodiscard]] inline ProtocolVersion parse_protocol(const std::string& value) {
    if (value == "v311" || value == "3.1.1" || value == "v3") {
        return ProtocolVersion::V311;
    }
    if (value == "v5" || value == "5") {
        return ProtocolVersion::V5;
    }
    throw std::invalid_argument("unknown protocol: " + value);
}

[[nodiscard]] inline QualityOfService parse_qos(int value) {
    if (value < 0 || value > 2) {
        throw std::invalid_argument("qos out of range: " + std::to_string(value));
    }
    return static_cast<QualityOfService>(value);
}

// ==================== Device Facts ====================

[[nodiscard]] inline Connection parse_connection(const json& j) {
    Connection conn;
    if (j.contains("kind")) {
        conn.kind = j["kind"].get<std::string>();
    }
    if (j.contains("address")) {
        conn.address = j["address"].get<std::string>();
    }
    return conn;
}

[[nodiscard]] inline json connection_to_json(const Connection& conn) {
    return json{{"kind", conn.kind}, {"address", conn.address}};
}

[[nodiscard]] inline DeviceFacts parse_device_facts(const json& j) {
    DeviceFacts facts;
    if (j.contains("serial_number") && !j["serial_number"].is_null()) {
        facts.serial_number = j["serial_number"].get<std::string>();
    }
    if (j.contains("connections") && j["connections"].is_array()) {
        for (const auto& item : j["connections"]) {
            facts.connections.push_back(parse_connection(item));
        }
    }
    return facts;
}

/// The serial is written as null when absent
[[nodiscard]] inline json device_facts_to_json(const DeviceFacts& facts) {
    json j;
    j["serial_number"] = facts.serial_number ? json(*facts.serial_number) : json(nullptr);
    j["connections"] = json::array();
    for (const auto& conn : facts.connections) {
        j["connections"].push_back(connection_to_json(conn));
    }
    return j;
}

// ==================== Connection Options ====================

[[nodiscard]] inline LastWill parse_last_will(const json& j) {
    LastWill will;
    will.topic = j.at("topic").get<std::string>();
    if (j.contains("payload")) {
        will.payload = j["payload"].get<std::string>();
    }
    if (j.contains("qos")) {
        will.qos = parse_qos(j["qos"].get<int>());
    }
    if (j.contains("retain")) {
        will.retain = j["retain"].get<bool>();
    }
    return will;
}

[[nodiscard]] inline Availability parse_availability(const json& j) {
    Availability availability;
    availability.topic = j.at("topic").get<std::string>();
    if (j.contains("payload_online")) {
        availability.payload_online = j["payload_online"].get<std::string>();
    }
    if (j.contains("payload_offline")) {
        availability.payload_offline = j["payload_offline"].get<std::string>();
    }
    if (j.contains("qos")) {
        availability.qos = parse_qos(j["qos"].get<int>());
    }
    if (j.contains("retain")) {
        availability.retain = j["retain"].get<bool>();
    }
    return availability;
}

/**
 * @brief Parse a connection option document
 *
 * `host` and `app_name` are required. An "availability" block also sets the
 * last will unless "last_will" is given explicitly.
 */
[[nodiscard]] inline ConnectionOptions parse_connection_options(const json& j) {
    ConnectionOptions options;
    options.host = j.at("host").get<std::string>();
    options.app_name = j.at("app_name").get<std::string>();

    if (j.contains("instance_id") && !j["instance_id"].is_null()) {
        options.instance_id = j["instance_id"].get<std::string>();
    }
    if (j.contains("protocol")) {
        options.protocol = parse_protocol(j["protocol"].get<std::string>());
    }
    if (j.contains("port")) {
        options.port = j["port"].get<int>();
    }
    if (j.contains("keep_alive")) {
        options.keep_alive = j["keep_alive"].get<int>();
    }
    if (j.contains("persistent_session")) {
        options.persistent_session = j["persistent_session"].get<bool>();
    }
    if (j.contains("max_client_id_length")) {
        options.max_client_id_length = j["max_client_id_length"].get<int>();
    }

    if (j.contains("login") && j["login"].is_object()) {
        const auto& login = j["login"];
        options.login = Credentials{login.at("username").get<std::string>(),
                                    login.at("password").get<std::string>()};
    }

    if (j.contains("availability") && j["availability"].is_object()) {
        options.availability = parse_availability(j["availability"]);
        const auto& a = *options.availability;
        options.last_will = LastWill{a.topic, a.payload_offline, a.qos, a.retain};
    }
    if (j.contains("last_will") && j["last_will"].is_object()) {
        options.last_will = parse_last_will(j["last_will"]);
    }

    if (j.contains("tls") && j["tls"].is_object()) {
        const auto& tls = j["tls"];
        TlsOptions tls_options;
        if (tls.contains("ca_certs") && !tls["ca_certs"].is_null()) {
            tls_options.ca_certs = tls["ca_certs"].get<std::string>();
        }
        if (tls.contains("allow_insecure")) {
            tls_options.allow_insecure = tls["allow_insecure"].get<bool>();
        }
        options.tls = tls_options;
    }

    if (j.contains("auto_reconnect") && j["auto_reconnect"].is_object()) {
        const auto& reconnect = j["auto_reconnect"];
        ReconnectBackoff backoff;
        if (reconnect.contains("min_delay")) {
            backoff.min_delay = reconnect["min_delay"].get<int>();
        }
        if (reconnect.contains("max_delay")) {
            backoff.max_delay = reconnect["max_delay"].get<int>();
        }
        options.auto_reconnect = backoff;
    }

    if (j.contains("device") && j["device"].is_object()) {
        options.device = parse_device_facts(j["device"]);
    }

    return options;
}

// ==================== Connection Settings ====================

/// Settings as a diagnostic document (the password is never written)
[[nodiscard]] inline json connection_settings_to_json(const ConnectionSettings& settings) {
    json j;
    j["client_id"] = settings.client_id;
    j["host"] = settings.host;
    j["port"] = settings.port;
    j["keep_alive"] = settings.keep_alive;
    j["protocol"] = protocol_version_to_string(settings.protocol);

    if (settings.clean_session) {
        j["clean_session"] = *settings.clean_session;
    }
    if (settings.clean_start) {
        j["clean_start"] = *settings.clean_start;
    }
    if (settings.session_expiry_interval) {
        j["session_expiry_interval"] = *settings.session_expiry_interval;
    }
    if (settings.login) {
        j["login"] = json{{"username", settings.login->username}};
    }
    if (settings.last_will) {
        const auto& will = *settings.last_will;
        j["last_will"] = json{{"topic", will.topic},
                              {"payload", will.payload},
                              {"qos", static_cast<int>(will.qos)},
                              {"retain", will.retain}};
    }
    if (settings.availability) {
        const auto& a = *settings.availability;
        j["availability"] = json{{"topic", a.topic},
                                 {"payload_online", a.payload_online},
                                 {"payload_offline", a.payload_offline},
                                 {"qos", static_cast<int>(a.qos)},
                                 {"retain", a.retain}};
    }
    if (settings.tls) {
        j["tls"] = json{{"allow_insecure", settings.tls->allow_insecure}};
        if (settings.tls->ca_certs) {
            j["tls"]["ca_certs"] = *settings.tls->ca_certs;
        }
    }
    if (settings.auto_reconnect) {
        j["auto_reconnect"] = json{{"min_delay", settings.auto_reconnect->min_delay},
                                   {"max_delay", settings.auto_reconnect->max_delay}};
    }
    return j;
}

}  // namespace json
}  // namespace mqttident
