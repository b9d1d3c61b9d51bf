#include <gtest/gtest.h>
#include <mqttident/connection.hpp>

#include <string>

namespace mqttident {
namespace {

FactCollector serial_collector(int* calls) {
    return [calls]() {
        ++*calls;
        return DeviceFacts{std::string("serial-client"), {}};
    };
}

// ==================== Builder Tests ====================

TEST(ConnectionBuilderTest, DefaultsFollowMqtt311) {
    auto settings = ConnectionBuilder("localhost", "agent")
                        .with_device_facts(DeviceFacts{std::string("sn1"), {}})
                        .build();

    ASSERT_TRUE(settings.is_ok()) << settings.error_message();
    const auto& s = settings.value();
    EXPECT_EQ(s.host, "localhost");
    EXPECT_EQ(s.port, DEFAULT_PORT);
    EXPECT_EQ(s.keep_alive, DEFAULT_KEEP_ALIVE);
    EXPECT_EQ(s.protocol, ProtocolVersion::V311);
    EXPECT_EQ(s.clean_session, std::optional<bool>(true));
    EXPECT_FALSE(s.clean_start.has_value());
    EXPECT_FALSE(s.session_expiry_interval.has_value());
    EXPECT_FALSE(s.requires_login());
    EXPECT_FALSE(s.has_tls());
    EXPECT_FALSE(s.last_will.has_value());
    EXPECT_FALSE(s.auto_reconnect.has_value());
    EXPECT_FALSE(s.availability_topic().has_value());
}

TEST(ConnectionBuilderTest, WithCallsLeaveReceiverUntouched) {
    auto base = ConnectionBuilder("localhost", "agent");
    auto derived = base.with_instance_id("worker1").with_port(8883).with_persistent_session();

    EXPECT_FALSE(base.options().instance_id.has_value());
    EXPECT_EQ(base.options().port, DEFAULT_PORT);
    EXPECT_FALSE(base.options().persistent_session);

    EXPECT_EQ(derived.options().instance_id, std::optional<std::string>("worker1"));
    EXPECT_EQ(derived.options().port, 8883);
    EXPECT_TRUE(derived.options().persistent_session);
}

TEST(ConnectionBuilderTest, PersistentSessionV311) {
    auto settings = ConnectionBuilder("localhost", "agent")
                        .with_device_facts(DeviceFacts{std::string("sn1"), {}})
                        .with_persistent_session()
                        .build();

    ASSERT_TRUE(settings.is_ok());
    EXPECT_EQ(settings.value().clean_session, std::optional<bool>(false));
}

TEST(ConnectionBuilderTest, PersistentSessionV5RequestsExpiry) {
    auto builder = ConnectionBuilder("localhost", "agent", ProtocolVersion::V5)
                       .with_device_facts(DeviceFacts{std::string("sn1"), {}});

    auto persistent = builder.with_persistent_session(true).build();
    auto clean = builder.with_persistent_session(false).build();

    ASSERT_TRUE(persistent.is_ok());
    ASSERT_TRUE(clean.is_ok());
    EXPECT_FALSE(persistent.value().clean_session.has_value());
    EXPECT_EQ(persistent.value().clean_start, std::optional<bool>(false));
    EXPECT_EQ(persistent.value().session_expiry_interval, std::optional<uint32_t>(3600));
    EXPECT_EQ(clean.value().clean_start, std::optional<bool>(true));
    EXPECT_EQ(clean.value().session_expiry_interval, std::optional<uint32_t>(0));
}

TEST(ConnectionBuilderTest, LoginTlsAndReconnect) {
    auto settings = ConnectionBuilder("broker.local", "agent")
                        .with_device_facts(DeviceFacts{std::string("sn1"), {}})
                        .with_login("user", "secret")
                        .with_own_tls("/etc/ssl/ca.pem", true)
                        .with_auto_reconnect(2, 60)
                        .with_keep_alive(30)
                        .build();

    ASSERT_TRUE(settings.is_ok());
    const auto& s = settings.value();
    ASSERT_TRUE(s.requires_login());
    EXPECT_EQ(s.login->username, "user");
    EXPECT_EQ(s.login->password, "secret");
    ASSERT_TRUE(s.has_tls());
    EXPECT_EQ(s.tls->ca_certs, std::optional<std::string>("/etc/ssl/ca.pem"));
    EXPECT_TRUE(s.tls->allow_insecure);
    ASSERT_TRUE(s.auto_reconnect.has_value());
    EXPECT_EQ(s.auto_reconnect->min_delay, 2);
    EXPECT_EQ(s.auto_reconnect->max_delay, 60);
    EXPECT_EQ(s.keep_alive, 30);
}

TEST(ConnectionBuilderTest, DefaultTlsUsesSystemStore) {
    auto settings = ConnectionBuilder("broker.local", "agent")
                        .with_device_facts(DeviceFacts{std::string("sn1"), {}})
                        .with_tls()
                        .build();

    ASSERT_TRUE(settings.is_ok());
    ASSERT_TRUE(settings.value().has_tls());
    EXPECT_FALSE(settings.value().tls->ca_certs.has_value());
    EXPECT_FALSE(settings.value().tls->allow_insecure);
}

TEST(ConnectionBuilderTest, AvailabilitySetsLastWill) {
    auto settings = ConnectionBuilder("broker.local", "agent")
                        .with_device_facts(DeviceFacts{std::string("sn1"), {}})
                        .with_availability("agents/a1/status", "up", "down", QualityOfService::ExactlyOnce,
                                           false)
                        .build();

    ASSERT_TRUE(settings.is_ok());
    const auto& s = settings.value();
    EXPECT_EQ(s.availability_topic(), std::optional<std::string>("agents/a1/status"));
    EXPECT_EQ(s.availability->payload_online, "up");
    ASSERT_TRUE(s.last_will.has_value());
    EXPECT_EQ(s.last_will->topic, "agents/a1/status");
    EXPECT_EQ(s.last_will->payload, "down");
    EXPECT_EQ(s.last_will->qos, QualityOfService::ExactlyOnce);
    EXPECT_FALSE(s.last_will->retain);
}

TEST(ConnectionBuilderTest, LastWillDefaults) {
    auto settings = ConnectionBuilder("broker.local", "agent")
                        .with_device_facts(DeviceFacts{std::string("sn1"), {}})
                        .with_last_will("agents/a1/will")
                        .build();

    ASSERT_TRUE(settings.is_ok());
    const auto& will = *settings.value().last_will;
    EXPECT_EQ(will.payload, "offline");
    EXPECT_EQ(will.qos, QualityOfService::AtLeastOnce);
    EXPECT_TRUE(will.retain);
}

// ==================== Validation Tests ====================

TEST(ConnectionBuilderValidationTest, RejectsBadOptions) {
    auto base = ConnectionBuilder("broker.local", "agent")
                    .with_device_facts(DeviceFacts{std::string("sn1"), {}});

    EXPECT_EQ(ConnectionBuilder("", "agent").build().error_code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(base.with_port(0).build().error_code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(base.with_port(65536).build().error_code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(base.with_keep_alive(-1).build().error_code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(base.with_auto_reconnect(0, 30).build().error_code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(base.with_auto_reconnect(10, 5).build().error_code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(base.with_last_will("").build().error_code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(base.with_max_client_id_length(7).build().error_code(),
              ErrorCode::InvalidConfiguration);
    EXPECT_TRUE(base.with_port(65535).build().is_ok());
    EXPECT_TRUE(base.with_keep_alive(0).build().is_ok());
}

TEST(ConnectionBuilderValidationTest, RejectsBadIdentity) {
    int calls = 0;
    auto result = ConnectionBuilder("broker.local", "bad name!")
                      .with_fact_collector(serial_collector(&calls))
                      .build();

    EXPECT_EQ(result.error_code(), ErrorCode::InvalidComponent);
    EXPECT_EQ(calls, 0);
}

// ==================== Client Identifier Tests ====================

TEST(ConnectionClientIdTest, CollectorFactsGiveSameIdAsDirectDerivation) {
    auto expected = build_auto_client_id("agent", std::string("worker1"), DEFAULT_MAX_CLIENT_ID_LENGTH,
                                         std::string("serial-client"), std::vector<Connection>{});
    ASSERT_TRUE(expected.is_ok());

    for (auto protocol : {ProtocolVersion::V311, ProtocolVersion::V5}) {
        int calls = 0;
        auto settings = ConnectionBuilder("localhost", "agent", protocol)
                            .with_instance_id("worker1")
                            .with_fact_collector(serial_collector(&calls))
                            .build();

        ASSERT_TRUE(settings.is_ok()) << settings.error_message();
        EXPECT_EQ(settings.value().client_id, expected.value());
        EXPECT_EQ(calls, 1);
    }
}

TEST(ConnectionClientIdTest, CollectorRunsAtBuildTime) {
    int calls = 0;
    auto builder = ConnectionBuilder("localhost", "agent").with_fact_collector(serial_collector(&calls));
    EXPECT_EQ(calls, 0);

    ASSERT_TRUE(builder.build().is_ok());
    ASSERT_TRUE(builder.build().is_ok());
    EXPECT_EQ(calls, 2);
}

TEST(ConnectionClientIdTest, SuppliedFactsSkipCollector) {
    int calls = 0;
    auto settings = ConnectionBuilder("localhost", "agent")
                        .with_fact_collector(serial_collector(&calls))
                        .with_device_facts(DeviceFacts{std::nullopt, {{"mac", "00:1a:2b:3c:4d:5e"}}})
                        .build();

    ASSERT_TRUE(settings.is_ok());
    EXPECT_EQ(calls, 0);

    auto expected = build_auto_client_id("agent", std::nullopt, DEFAULT_MAX_CLIENT_ID_LENGTH,
                                         std::nullopt,
                                         std::vector<Connection>{{"mac", "00:1a:2b:3c:4d:5e"}});
    ASSERT_TRUE(expected.is_ok());
    EXPECT_EQ(settings.value().client_id, expected.value());
}

TEST(ConnectionClientIdTest, MaxLengthIsForwarded) {
    auto settings = ConnectionBuilder("localhost", "agent")
                        .with_device_facts(DeviceFacts{std::string("sn1"), {}})
                        .with_max_client_id_length(8)
                        .build();

    ASSERT_TRUE(settings.is_ok());
    EXPECT_EQ(settings.value().client_id.size(), 8u);
}

TEST(ConnectionClientIdTest, EventsReachTheSink) {
    EventBus bus;
    std::string built;
    auto sub = bus.on(events::CLIENT_ID_BUILT,
                      [&](const EventData& data) { built = std::any_cast<std::string>(data); });

    auto settings = ConnectionBuilder("localhost", "agent")
                        .with_device_facts(DeviceFacts{std::string("sn1"), {}})
                        .with_events(&bus)
                        .build();

    ASSERT_TRUE(settings.is_ok());
    EXPECT_EQ(built, settings.value().client_id);
}

TEST(ConnectionBuilderTest, FromOptions) {
    ConnectionOptions options;
    options.host = "broker.local";
    options.app_name = "agent";
    options.protocol = ProtocolVersion::V5;
    options.port = 8883;
    options.device = DeviceFacts{std::string("sn1"), {}};

    auto settings = ConnectionBuilder::from_options(options).build();

    ASSERT_TRUE(settings.is_ok());
    EXPECT_EQ(settings.value().port, 8883);
    EXPECT_EQ(settings.value().protocol, ProtocolVersion::V5);
}

TEST(ProtocolVersionTest, ToString) {
    EXPECT_STREQ(protocol_version_to_string(ProtocolVersion::V311), "v311");
    EXPECT_STREQ(protocol_version_to_string(ProtocolVersion::V5), "v5");
}

}  // namespace
}  // namespace mqttident
