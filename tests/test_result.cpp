#include <gtest/gtest.h>
#include <mqttident/mqttident.hpp>

#include <set>

namespace mqttident {
namespace {

TEST(ResultTest, OkResultIsNotError) {
    auto result = Result<int>::ok(42);

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(result.error_code(), ErrorCode::Success);
}

TEST(ResultTest, ErrorResultIsNotOk) {
    auto result = Result<int>::error(ErrorCode::InvalidComponent, "app_name is invalid: empty");

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::InvalidComponent);
    EXPECT_EQ(result.error_message(), "app_name is invalid: empty");
}

TEST(ResultTest, VoidOkResult) {
    auto result = Result<void>::ok();

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(result.error_code(), ErrorCode::Success);
}

TEST(ResultTest, VoidErrorResult) {
    auto result = Result<void>::error(ErrorCode::InvalidConfiguration);

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::InvalidConfiguration);
    EXPECT_TRUE(result.error_message().empty());
}

TEST(ResultTest, PropagateKeepsCodeAndMessage) {
    auto inner = Result<int>::error(ErrorCode::DigestError, "SHAKE256 unavailable");
    auto outer = Result<std::string>::propagate(inner);

    EXPECT_TRUE(outer.is_error());
    EXPECT_EQ(outer.error_code(), ErrorCode::DigestError);
    EXPECT_EQ(outer.error_message(), "SHAKE256 unavailable");
}

TEST(ResultTest, MoveValueOut) {
    auto result = Result<std::string>::ok("agent-abcdefgh");
    std::string value = std::move(result).value();
    EXPECT_EQ(value, "agent-abcdefgh");
}

TEST(ErrorCodeTest, ToStringConversion) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::Success), "Success");
    EXPECT_STREQ(error_code_to_string(ErrorCode::InvalidComponent), "Invalid identity component");
    EXPECT_STREQ(error_code_to_string(ErrorCode::InvalidConfiguration), "Invalid configuration");
    EXPECT_STREQ(error_code_to_string(ErrorCode::InvalidInput), "Invalid input");
    EXPECT_STREQ(error_code_to_string(ErrorCode::FileNotFound), "File not found");
    EXPECT_STREQ(error_code_to_string(ErrorCode::Unknown), "Unknown error");
}

// ==================== Connection Tests ====================

TEST(ConnectionTest, OrderedByKindThenAddress) {
    Connection bt{"bluetooth", "00:11:22:33:44:55"};
    Connection mac_a{"mac", "00:00:00:00:00:01"};
    Connection mac_b{"mac", "00:00:00:00:00:02"};

    EXPECT_TRUE(bt < mac_a);
    EXPECT_TRUE(mac_a < mac_b);
    EXPECT_FALSE(mac_b < mac_a);
}

TEST(ConnectionTest, DuplicatesCollapseInSet) {
    std::set<Connection> set;
    set.insert({"mac", "00:1a:2b:3c:4d:5e"});
    set.insert({"mac", "00:1a:2b:3c:4d:5e"});
    set.insert({"bluetooth", "00:1a:2b:3c:4d:5e"});

    EXPECT_EQ(set.size(), 2u);
    EXPECT_EQ((Connection{"mac", "x"}), (Connection{"mac", "x"}));
    EXPECT_NE((Connection{"mac", "x"}), (Connection{"bluetooth", "x"}));
}

TEST(ConstantsTest, SeparatorIsUnitSeparator) {
    EXPECT_EQ(SEED_SEPARATOR, '\x1f');
    EXPECT_EQ(DEFAULT_MAX_CLIENT_ID_LENGTH, 23);
    EXPECT_EQ(MIN_CLIENT_ID_LENGTH, 8);
    EXPECT_STREQ(CLIENT_ID_NAMESPACE, "mqtt-client.v1");
}

}  // namespace
}  // namespace mqttident
