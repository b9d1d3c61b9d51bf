#include "mqttident/identity.hpp"

#include "mqttident/crypto.hpp"
#include "mqttident/device.hpp"
#include "mqttident/facts.hpp"

#include "string_util.hpp"

#include <algorithm>
#include <cctype>
#include <tuple>

namespace mqttident {

namespace {

int connection_rank(const std::string& kind) {
    if (kind == connection_kind::MAC) {
        return 0;
    }
    if (kind == connection_kind::BLUETOOTH) {
        return 1;
    }
    return 2;
}

bool is_component_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-';
}

/// "sn:abc" -> "sn"
std::string fingerprint_kind(const std::string& fingerprint) {
    return fingerprint.substr(0, fingerprint.find(':'));
}

/// Drop leading and trailing '-' and collapse "--" runs: "-a--b-" -> "a-b"
std::string tidy_prefix(const std::string& cut) {
    std::string prefix;
    prefix.reserve(cut.size());
    for (char c : cut) {
        if (c == '-' && (prefix.empty() || prefix.back() == '-')) {
            continue;
        }
        prefix.push_back(c);
    }
    if (!prefix.empty() && prefix.back() == '-') {
        prefix.pop_back();
    }
    return prefix;
}

Result<std::string> fail(EventBus* events, ErrorCode code, const std::string& message) {
    emit_event(events, events::CLIENT_ID_ERROR, message);
    return Result<std::string>::error(code, message);
}

}  // namespace

// ==================== Validation ====================

Result<std::string> validate_component(const std::string& value, const std::string& field_name) {
    std::string trimmed = detail::trim(value);
    if (trimmed.empty()) {
        return Result<std::string>::error(ErrorCode::InvalidComponent,
                                          field_name + " is invalid: must not be empty");
    }
    if (!std::all_of(trimmed.begin(), trimmed.end(), is_component_char)) {
        return Result<std::string>::error(
            ErrorCode::InvalidComponent,
            field_name + " is invalid: only letters, digits and '-' are allowed");
    }
    return Result<std::string>::ok(detail::to_lower(trimmed));
}

// ==================== Fingerprint ====================

std::string resolve_device_fingerprint(const std::optional<std::string>& serial_number,
                                       const std::vector<Connection>& connections) {
    return resolve_device_fingerprint(serial_number, connections, device::get_hostname);
}

std::string resolve_device_fingerprint(const std::optional<std::string>& serial_number,
                                       const std::vector<Connection>& connections,
                                       const HostnameProvider& hostname) {
    if (serial_number) {
        std::string serial = detail::trim(*serial_number);
        if (!serial.empty()) {
            return "sn:" + detail::to_lower(serial);
        }
    }

    const Connection* best = nullptr;
    std::string best_address;
    for (const auto& conn : connections) {
        std::string address = detail::trim(conn.address);
        if (address.empty()) {
            continue;
        }
        if (best == nullptr ||
            std::make_tuple(connection_rank(conn.kind), conn.address) <
                std::make_tuple(connection_rank(best->kind), best->address)) {
            best = &conn;
            best_address = std::move(address);
        }
    }
    if (best != nullptr) {
        return best->kind + ":" + detail::to_lower(best_address);
    }

    if (hostname) {
        auto name = hostname();
        if (name) {
            std::string trimmed = detail::trim(*name);
            if (!trimmed.empty()) {
                return "host:" + detail::to_lower(trimmed);
            }
        }
    }
    return "host:unknown";
}

// ==================== Client identifier ====================

Result<std::string> build_auto_client_id(const ClientIdRequest& request,
                                         const FactCollector& collector, EventBus* events) {
    auto app = validate_component(request.app_name, "app_name");
    if (app.is_error()) {
        return fail(events, app.error_code(), app.error_message());
    }

    std::optional<std::string> instance;
    if (request.instance_id) {
        auto validated = validate_component(*request.instance_id, "instance_id");
        if (validated.is_error()) {
            return fail(events, validated.error_code(), validated.error_message());
        }
        instance = validated.value();
    }

    if (request.max_length < MIN_CLIENT_ID_LENGTH) {
        return fail(events, ErrorCode::InvalidConfiguration,
                    "max_length must be at least " + std::to_string(MIN_CLIENT_ID_LENGTH));
    }

    DeviceFacts device_facts;
    if (!request.serial_number && !request.connections) {
        device_facts = collector ? collector() : facts::collect_device_facts(events);
    } else {
        device_facts.serial_number = request.serial_number;
        if (request.connections) {
            device_facts.connections = *request.connections;
        }
    }

    std::string fingerprint =
        resolve_device_fingerprint(device_facts.serial_number, device_facts.connections);
    emit_event(events, events::FINGERPRINT_RESOLVED, fingerprint_kind(fingerprint));

    std::string seed = fingerprint + SEED_SEPARATOR + app.value();
    if (instance) {
        seed += SEED_SEPARATOR;
        seed += *instance;
    }

    const int max_length = request.max_length;
    const int hash_length = std::min(12, std::max(8, max_length - 4));
    auto suffix = crypto::build_compact_token(seed, hash_length, std::string(CLIENT_ID_NAMESPACE));
    if (suffix.is_error()) {
        return fail(events, suffix.error_code(), suffix.error_message());
    }

    std::string client_id;
    const int prefix_budget = max_length - static_cast<int>(suffix.value().size()) - 1;
    std::string prefix = prefix_budget > 0
                             ? tidy_prefix(app.value().substr(0, static_cast<size_t>(prefix_budget)))
                             : std::string();
    if (prefix.empty()) {
        client_id = suffix.value();
    } else {
        client_id = prefix + "-" + suffix.value();
    }
    if (client_id.size() > static_cast<size_t>(max_length)) {
        client_id.resize(static_cast<size_t>(max_length));
    }

    emit_event(events, events::CLIENT_ID_BUILT, client_id);
    return Result<std::string>::ok(std::move(client_id));
}

Result<std::string> build_auto_client_id(const std::string& app_name,
                                         const std::optional<std::string>& instance_id,
                                         int max_length,
                                         const std::optional<std::string>& serial_number,
                                         const std::optional<std::vector<Connection>>& connections) {
    ClientIdRequest request;
    request.app_name = app_name;
    request.instance_id = instance_id;
    request.max_length = max_length;
    request.serial_number = serial_number;
    request.connections = connections;
    return build_auto_client_id(request);
}

}  // namespace mqttident
