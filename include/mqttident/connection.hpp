#pragma once

/**
 * @file connection.hpp
 * @brief Connection configuration for an MQTT client
 *
 * ConnectionBuilder collects broker, session and identity options as an
 * immutable value. build() derives the client identifier from device facts
 * and yields the ConnectionSettings that an MQTT client layer consumes.
 *
 * Example:
 * @code
 * auto settings = mqttident::ConnectionBuilder("broker.local", "agent")
 *                     .with_instance_id("worker1")
 *                     .with_availability("agents/worker1/status")
 *                     .with_auto_reconnect()
 *                     .build();
 * if (settings.is_ok()) {
 *     connect(settings.value().client_id, settings.value().host);
 * }
 * @endcode
 */

#include "mqttident/events.hpp"
#include "mqttident/identity.hpp"
#include "mqttident/mqttident.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mqttident {

/// Default MQTT broker port
constexpr int DEFAULT_PORT = 1883;

/// Default keep-alive interval in seconds
constexpr int DEFAULT_KEEP_ALIVE = 60;

/// Session expiry requested by persistent MQTT 5 sessions (seconds)
constexpr uint32_t PERSISTENT_SESSION_EXPIRY = 3600;

/// MQTT protocol revision
enum class ProtocolVersion { V311, V5 };

/// Convert protocol version to string
[[nodiscard]] constexpr const char* protocol_version_to_string(ProtocolVersion version) noexcept {
    switch (version) {
        case ProtocolVersion::V311:
            return "v311";
        case ProtocolVersion::V5:
            return "v5";
    }
    return "v311";
}

/// MQTT delivery guarantee
enum class QualityOfService { AtMostOnce = 0, AtLeastOnce = 1, ExactlyOnce = 2 };

/// Username/password login
struct Credentials {
    std::string username;
    std::string password;
};

/// Message the broker publishes on an unclean disconnect
struct LastWill {
    std::string topic;
    std::string payload = "offline";
    QualityOfService qos = QualityOfService::AtLeastOnce;
    bool retain = true;
};

/**
 * @brief Availability topic
 *
 * The client layer publishes `payload_online` after connecting and
 * `payload_offline` before a clean disconnect. The offline payload is also
 * registered as the last will.
 */
struct Availability {
    std::string topic;
    std::string payload_online = "online";
    std::string payload_offline = "offline";
    QualityOfService qos = QualityOfService::AtLeastOnce;
    bool retain = true;
};

/// TLS transport settings
struct TlsOptions {
    /// CA bundle path (system default when unset)
    std::optional<std::string> ca_certs;

    /// Skip certificate hostname checks (testing only)
    bool allow_insecure = false;
};

/// Exponential reconnect backoff bounds in seconds
struct ReconnectBackoff {
    int min_delay = 1;
    int max_delay = 30;
};

/**
 * @brief Options gathered by ConnectionBuilder
 */
struct ConnectionOptions {
    /// Broker hostname or IP literal (required)
    std::string host;

    /// Stable application name, part of the client identifier (required)
    std::string app_name;

    /// Separates parallel instances of the same application
    std::optional<std::string> instance_id;

    ProtocolVersion protocol = ProtocolVersion::V311;
    int port = DEFAULT_PORT;
    int keep_alive = DEFAULT_KEEP_ALIVE;
    bool persistent_session = false;
    int max_client_id_length = DEFAULT_MAX_CLIENT_ID_LENGTH;

    std::optional<Credentials> login;
    std::optional<LastWill> last_will;
    std::optional<Availability> availability;
    std::optional<TlsOptions> tls;
    std::optional<ReconnectBackoff> auto_reconnect;

    /// Facts to derive the identifier from; probed at build time when unset
    std::optional<DeviceFacts> device;
};

/**
 * @brief Final, validated connection parameters
 */
struct ConnectionSettings {
    std::string client_id;
    std::string host;
    int port = DEFAULT_PORT;
    int keep_alive = DEFAULT_KEEP_ALIVE;
    ProtocolVersion protocol = ProtocolVersion::V311;

    /// MQTT 3.1.1 only
    std::optional<bool> clean_session;

    /// MQTT 5 only
    std::optional<bool> clean_start;
    std::optional<uint32_t> session_expiry_interval;

    std::optional<Credentials> login;
    std::optional<LastWill> last_will;
    std::optional<Availability> availability;
    std::optional<TlsOptions> tls;
    std::optional<ReconnectBackoff> auto_reconnect;

    [[nodiscard]] bool requires_login() const noexcept { return login.has_value(); }
    [[nodiscard]] bool has_tls() const noexcept { return tls.has_value(); }

    /// Topic of the availability messages, if configured
    [[nodiscard]] std::optional<std::string> availability_topic() const {
        if (availability) {
            return availability->topic;
        }
        return std::nullopt;
    }
};

/**
 * @brief Immutable builder for ConnectionSettings
 *
 * Every with_* call returns a modified copy; the receiver is left unchanged,
 * so a partially configured builder can be shared as a template.
 */
class ConnectionBuilder {
  public:
    ConnectionBuilder(std::string host, std::string app_name,
                      ProtocolVersion protocol = ProtocolVersion::V311);

    /// Start from a complete option set (e.g. loaded from a config file)
    [[nodiscard]] static ConnectionBuilder from_options(ConnectionOptions options);

    [[nodiscard]] ConnectionBuilder with_instance_id(std::string instance_id) const;
    [[nodiscard]] ConnectionBuilder with_persistent_session(bool persistent = true) const;
    [[nodiscard]] ConnectionBuilder with_port(int port) const;
    [[nodiscard]] ConnectionBuilder with_keep_alive(int seconds) const;
    [[nodiscard]] ConnectionBuilder with_login(std::string username, std::string password) const;

    [[nodiscard]] ConnectionBuilder with_last_will(
        std::string topic, std::string payload = "offline",
        QualityOfService qos = QualityOfService::AtLeastOnce, bool retain = true) const;

    /// Also sets the last will to the offline payload
    [[nodiscard]] ConnectionBuilder with_availability(
        std::string topic, std::string payload_online = "online",
        std::string payload_offline = "offline",
        QualityOfService qos = QualityOfService::AtLeastOnce, bool retain = true) const;

    /// TLS with the system CA store
    [[nodiscard]] ConnectionBuilder with_tls(bool allow_insecure = false) const;

    /// TLS with a custom CA bundle
    [[nodiscard]] ConnectionBuilder with_own_tls(std::string ca_certs,
                                                 bool allow_insecure = false) const;

    [[nodiscard]] ConnectionBuilder with_auto_reconnect(int min_delay = 1, int max_delay = 30) const;

    /// Use these facts instead of probing the device
    [[nodiscard]] ConnectionBuilder with_device_facts(DeviceFacts facts) const;

    /// Replace the device probe run by build()
    [[nodiscard]] ConnectionBuilder with_fact_collector(FactCollector collector) const;

    [[nodiscard]] ConnectionBuilder with_max_client_id_length(int max_length) const;

    /// Diagnostic sink for probing and identifier derivation (not owned)
    [[nodiscard]] ConnectionBuilder with_events(EventBus* events) const;

    [[nodiscard]] const ConnectionOptions& options() const noexcept { return options_; }

    /**
     * @brief Validate the options and derive the client identifier
     *
     * @return Settings, or InvalidConfiguration / InvalidComponent /
     *         DigestError
     */
    [[nodiscard]] Result<ConnectionSettings> build() const;

  private:
    explicit ConnectionBuilder(ConnectionOptions options);

    ConnectionOptions options_;
    FactCollector collector_;
    EventBus* events_ = nullptr;
};

}  // namespace mqttident
