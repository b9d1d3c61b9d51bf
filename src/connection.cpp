#include "mqttident/connection.hpp"

#include <utility>

namespace mqttident {

namespace {

Result<void> check_options(const ConnectionOptions& options) {
    if (options.host.empty()) {
        return Result<void>::error(ErrorCode::InvalidConfiguration, "host must not be empty");
    }
    if (options.port < 1 || options.port > 65535) {
        return Result<void>::error(ErrorCode::InvalidConfiguration,
                                   "port out of range: " + std::to_string(options.port));
    }
    if (options.keep_alive < 0) {
        return Result<void>::error(ErrorCode::InvalidConfiguration,
                                   "keep_alive must not be negative");
    }
    if (options.auto_reconnect) {
        const auto& backoff = *options.auto_reconnect;
        if (backoff.min_delay <= 0 || backoff.max_delay < backoff.min_delay) {
            return Result<void>::error(ErrorCode::InvalidConfiguration,
                                       "auto_reconnect requires 0 < min_delay <= max_delay");
        }
    }
    if (options.last_will && options.last_will->topic.empty()) {
        return Result<void>::error(ErrorCode::InvalidConfiguration,
                                   "last_will topic must not be empty");
    }
    if (options.availability && options.availability->topic.empty()) {
        return Result<void>::error(ErrorCode::InvalidConfiguration,
                                   "availability topic must not be empty");
    }
    return Result<void>::ok();
}

}  // namespace

ConnectionBuilder::ConnectionBuilder(std::string host, std::string app_name,
                                     ProtocolVersion protocol) {
    options_.host = std::move(host);
    options_.app_name = std::move(app_name);
    options_.protocol = protocol;
}

ConnectionBuilder::ConnectionBuilder(ConnectionOptions options) : options_(std::move(options)) {}

ConnectionBuilder ConnectionBuilder::from_options(ConnectionOptions options) {
    return ConnectionBuilder(std::move(options));
}

ConnectionBuilder ConnectionBuilder::with_instance_id(std::string instance_id) const {
    ConnectionBuilder next = *this;
    next.options_.instance_id = std::move(instance_id);
    return next;
}

ConnectionBuilder ConnectionBuilder::with_persistent_session(bool persistent) const {
    ConnectionBuilder next = *this;
    next.options_.persistent_session = persistent;
    return next;
}

ConnectionBuilder ConnectionBuilder::with_port(int port) const {
    ConnectionBuilder next = *this;
    next.options_.port = port;
    return next;
}

ConnectionBuilder ConnectionBuilder::with_keep_alive(int seconds) const {
    ConnectionBuilder next = *this;
    next.options_.keep_alive = seconds;
    return next;
}

ConnectionBuilder ConnectionBuilder::with_login(std::string username, std::string password) const {
    ConnectionBuilder next = *this;
    next.options_.login = Credentials{std::move(username), std::move(password)};
    return next;
}

ConnectionBuilder ConnectionBuilder::with_last_will(std::string topic, std::string payload,
                                                    QualityOfService qos, bool retain) const {
    ConnectionBuilder next = *this;
    next.options_.last_will = LastWill{std::move(topic), std::move(payload), qos, retain};
    return next;
}

ConnectionBuilder ConnectionBuilder::with_availability(std::string topic,
                                                       std::string payload_online,
                                                       std::string payload_offline,
                                                       QualityOfService qos, bool retain) const {
    ConnectionBuilder next = with_last_will(topic, payload_offline, qos, retain);
    next.options_.availability =
        Availability{std::move(topic), std::move(payload_online), std::move(payload_offline), qos, retain};
    return next;
}

ConnectionBuilder ConnectionBuilder::with_tls(bool allow_insecure) const {
    ConnectionBuilder next = *this;
    next.options_.tls = TlsOptions{std::nullopt, allow_insecure};
    return next;
}

ConnectionBuilder ConnectionBuilder::with_own_tls(std::string ca_certs, bool allow_insecure) const {
    ConnectionBuilder next = *this;
    next.options_.tls = TlsOptions{std::move(ca_certs), allow_insecure};
    return next;
}

ConnectionBuilder ConnectionBuilder::with_auto_reconnect(int min_delay, int max_delay) const {
    ConnectionBuilder next = *this;
    next.options_.auto_reconnect = ReconnectBackoff{min_delay, max_delay};
    return next;
}

ConnectionBuilder ConnectionBuilder::with_device_facts(DeviceFacts facts) const {
    ConnectionBuilder next = *this;
    next.options_.device = std::move(facts);
    return next;
}

ConnectionBuilder ConnectionBuilder::with_fact_collector(FactCollector collector) const {
    ConnectionBuilder next = *this;
    next.collector_ = std::move(collector);
    return next;
}

ConnectionBuilder ConnectionBuilder::with_max_client_id_length(int max_length) const {
    ConnectionBuilder next = *this;
    next.options_.max_client_id_length = max_length;
    return next;
}

ConnectionBuilder ConnectionBuilder::with_events(EventBus* events) const {
    ConnectionBuilder next = *this;
    next.events_ = events;
    return next;
}

Result<ConnectionSettings> ConnectionBuilder::build() const {
    auto checked = check_options(options_);
    if (checked.is_error()) {
        return Result<ConnectionSettings>::error(checked.error_code(), checked.error_message());
    }

    ClientIdRequest request;
    request.app_name = options_.app_name;
    request.instance_id = options_.instance_id;
    request.max_length = options_.max_client_id_length;
    if (options_.device) {
        request.serial_number = options_.device->serial_number;
        request.connections = options_.device->connections;
    }

    auto client_id = build_auto_client_id(request, collector_, events_);
    if (client_id.is_error()) {
        return Result<ConnectionSettings>::propagate(client_id);
    }

    ConnectionSettings settings;
    settings.client_id = std::move(client_id).value();
    settings.host = options_.host;
    settings.port = options_.port;
    settings.keep_alive = options_.keep_alive;
    settings.protocol = options_.protocol;

    if (options_.protocol == ProtocolVersion::V5) {
        settings.clean_start = !options_.persistent_session;
        settings.session_expiry_interval = options_.persistent_session ? PERSISTENT_SESSION_EXPIRY : 0;
    } else {
        settings.clean_session = !options_.persistent_session;
    }

    settings.login = options_.login;
    settings.last_will = options_.last_will;
    settings.availability = options_.availability;
    settings.tls = options_.tls;
    settings.auto_reconnect = options_.auto_reconnect;

    return Result<ConnectionSettings>::ok(std::move(settings));
}

}  // namespace mqttident
