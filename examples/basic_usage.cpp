/**
 * @file basic_usage.cpp
 * @brief Basic usage example for mqttident
 *
 * This example demonstrates how to:
 * - Inspect the device facts collected on this machine
 * - Derive a client identifier directly
 * - Build connection settings with the builder
 * - Load connection options from a JSON file
 * - Handle errors using the Result type
 */

#include <mqttident/config.hpp>
#include <mqttident/connection.hpp>
#include <mqttident/facts.hpp>
#include <mqttident/identity.hpp>
#include <mqttident/json.hpp>

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    mqttident::EventBus events;

    auto absent = events.on(mqttident::events::PROBE_SOURCE_ABSENT, [](const std::any& data) {
        const auto& event = std::any_cast<const mqttident::ProbeEvent&>(data);
        std::cout << "[probe] " << event.source << ": " << event.detail << "\n";
    });
    auto resolved = events.on(mqttident::events::FINGERPRINT_RESOLVED, [](const std::any& data) {
        std::cout << "[identity] fingerprint kind: " << std::any_cast<std::string>(data) << "\n";
    });

    // Example 1: Device facts
    std::cout << "=== Device Facts (" << mqttident::device::get_platform_name() << ") ===\n";
    auto facts = mqttident::facts::collect_device_facts(&events);
    std::cout << mqttident::json::device_facts_to_json(facts).dump(2) << "\n";

    // Example 2: Direct derivation
    std::cout << "\n=== Client Identifier ===\n";
    mqttident::ClientIdRequest request;
    request.app_name = "agent";
    request.instance_id = "worker1";
    request.serial_number = facts.serial_number;
    request.connections = facts.connections;

    auto client_id = mqttident::build_auto_client_id(request, nullptr, &events);
    if (client_id.is_error()) {
        std::cerr << "Error: " << client_id.error_message() << "\n";
        return 1;
    }
    std::cout << "Client ID: " << client_id.value() << "\n";

    // Example 3: Connection settings
    std::cout << "\n=== Connection Settings ===\n";
    auto settings = mqttident::ConnectionBuilder("broker.local", "agent", mqttident::ProtocolVersion::V5)
                        .with_instance_id("worker1")
                        .with_persistent_session()
                        .with_availability("agents/worker1/status")
                        .with_auto_reconnect(1, 30)
                        .with_device_facts(facts)
                        .with_events(&events)
                        .build();
    if (settings.is_error()) {
        std::cerr << "Error (" << mqttident::error_code_to_string(settings.error_code())
                  << "): " << settings.error_message() << "\n";
        return 1;
    }
    std::cout << mqttident::json::connection_settings_to_json(settings.value()).dump(2) << "\n";

    // Example 4: Options from a file
    if (argc > 1) {
        std::cout << "\n=== Options from " << argv[1] << " ===\n";
        auto options = mqttident::config::load_connection_options(argv[1]);
        if (options.is_error()) {
            std::cerr << "Error (" << mqttident::error_code_to_string(options.error_code())
                      << "): " << options.error_message() << "\n";
            return 1;
        }
        auto loaded = mqttident::ConnectionBuilder::from_options(options.value())
                          .with_events(&events)
                          .build();
        if (loaded.is_error()) {
            std::cerr << "Error: " << loaded.error_message() << "\n";
            return 1;
        }
        std::cout << "Client ID: " << loaded.value().client_id << "\n";
    }

    return 0;
}
