#include <gtest/gtest.h>
#include <mqttident/device.hpp>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace mqttident {
namespace device {
namespace {

// ==================== Platform Tests ====================

TEST(DevicePlatformTest, PlatformToString) {
    EXPECT_STREQ(platform_to_string(Platform::Embedded), "embedded");
    EXPECT_STREQ(platform_to_string(Platform::Linux), "linux");
    EXPECT_STREQ(platform_to_string(Platform::Darwin), "darwin");
    EXPECT_STREQ(platform_to_string(Platform::Windows), "windows");
    EXPECT_STREQ(platform_to_string(Platform::Unknown), "unknown");
}

TEST(DevicePlatformTest, DetectsHostPlatform) {
    auto platform = detect_platform();

#if defined(__APPLE__)
    EXPECT_EQ(platform, Platform::Darwin);
#elif defined(_WIN32) || defined(_WIN64)
    EXPECT_EQ(platform, Platform::Windows);
#elif defined(__linux__)
    EXPECT_EQ(platform, Platform::Linux);
#endif
    EXPECT_EQ(get_platform_name(), platform_to_string(platform));
}

// ==================== Hostname Tests ====================

TEST(DeviceHostnameTest, HostnameIsReasonable) {
    auto hostname = get_hostname();

    // May be unavailable in sandboxes; when present it must be sane
    if (hostname) {
        EXPECT_FALSE(hostname->empty());
        EXPECT_LE(hostname->size(), 255u);
    }
}

// ==================== MemoryFactSource Tests ====================

TEST(MemoryFactSourceTest, MissingEntriesAreAbsent) {
    MemoryFactSource source;

    EXPECT_FALSE(source.read_file("/proc/cpuinfo").has_value());
    EXPECT_FALSE(source.list_directory("/sys/class/net").has_value());
    EXPECT_FALSE(source.run_command({"btmgmt", "info"}).has_value());
    EXPECT_FALSE(source.registry_property("IOPlatformSerialNumber").has_value());
    EXPECT_FALSE(source.board_unique_id().has_value());
    EXPECT_TRUE(source.board_interface_macs().empty());
}

TEST(MemoryFactSourceTest, DirectoriesAreImpliedByFiles) {
    MemoryFactSource source;
    source.set_file("/sys/class/net/eth0/address", "00:1a:2b:3c:4d:5e\n");
    source.set_file("/sys/class/net/eth0/mtu", "1500\n");
    source.set_file("/sys/class/net/wlan0/address", "00:1a:2b:3c:4d:5f\n");
    source.set_file("/sys/class/netx/other", "");

    auto entries = source.list_directory("/sys/class/net");
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ((*entries)[0], "eth0");
    EXPECT_EQ((*entries)[1], "wlan0");

    auto with_slash = source.list_directory("/sys/class/net/");
    ASSERT_TRUE(with_slash.has_value());
    EXPECT_EQ(with_slash->size(), 2u);
}

TEST(MemoryFactSourceTest, EntriesAreUniqueWhenNamesShareAPrefix) {
    MemoryFactSource source;
    source.set_file("/sys/class/net/a", "");
    source.set_file("/sys/class/net/a-b/address", "00:1a:2b:3c:4d:5e\n");
    source.set_file("/sys/class/net/a/address", "00:1a:2b:3c:4d:5f\n");

    auto entries = source.list_directory("/sys/class/net");
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ((*entries)[0], "a");
    EXPECT_EQ((*entries)[1], "a-b");
}

TEST(MemoryFactSourceTest, CommandsMatchWholeArgv) {
    MemoryFactSource source;
    source.set_command_output({"btmgmt", "info"}, "addr 00:1A:7D:DA:71:13 version 8");

    EXPECT_TRUE(source.run_command({"btmgmt", "info"}).has_value());
    EXPECT_FALSE(source.run_command({"btmgmt"}).has_value());

    ASSERT_EQ(source.command_log().size(), 2u);
    EXPECT_EQ(source.command_log()[1], std::vector<std::string>{"btmgmt"});
}

TEST(MemoryFactSourceTest, BoardData) {
    MemoryFactSource source;
    source.set_board_unique_id({0x24, 0x0a, 0xc4});
    source.add_board_interface_mac({0x24, 0x0a, 0xc4, 0x01, 0x02, 0x03});

    ASSERT_TRUE(source.board_unique_id().has_value());
    EXPECT_EQ(source.board_unique_id()->size(), 3u);
    EXPECT_EQ(source.board_interface_macs().size(), 1u);
}

// ==================== SystemFactSource Tests ====================

class SystemFactSourceTest : public ::testing::Test {
  protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("mqttident_device_test_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(dir_ / "net" / "eth0");
        std::filesystem::create_directories(dir_ / "net" / "lo");
        std::ofstream(dir_ / "net" / "eth0" / "address") << "00:1a:2b:3c:4d:5e\n";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(SystemFactSourceTest, ReadsFiles) {
    SystemFactSource source;

    auto content = source.read_file((dir_ / "net" / "eth0" / "address").string());
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "00:1a:2b:3c:4d:5e\n");

    EXPECT_FALSE(source.read_file((dir_ / "missing").string()).has_value());
}

TEST_F(SystemFactSourceTest, ListsDirectoriesSorted) {
    SystemFactSource source;

    auto entries = source.list_directory((dir_ / "net").string());
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ((*entries)[0], "eth0");
    EXPECT_EQ((*entries)[1], "lo");

    EXPECT_FALSE(source.list_directory((dir_ / "bluetooth").string()).has_value());
}

TEST(SystemFactSourceDefaultsTest, CommandTimeout) {
    EXPECT_EQ(SystemFactSource().command_timeout(), process::DEFAULT_COMMAND_TIMEOUT);
    EXPECT_EQ(SystemFactSource(std::chrono::milliseconds(250)).command_timeout().count(), 250);
}

TEST(SystemFactSourceDefaultsTest, MissingCommandIsAbsent) {
    SystemFactSource source(std::chrono::milliseconds(500));
    EXPECT_FALSE(source.run_command({"mqttident-no-such-binary-7f3a"}).has_value());
}

}  // namespace
}  // namespace device
}  // namespace mqttident
