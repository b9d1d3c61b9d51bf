#include "mqttident/device.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>

// Platform detection
#if defined(ESP_PLATFORM) || defined(ARDUINO) || defined(__ZEPHYR__)
#define MQTTIDENT_PLATFORM_EMBEDDED 1
#if defined(ESP_PLATFORM)
#include "esp_mac.h"
#include "esp_system.h"
#endif
#elif defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/IOKitLib.h>
#define MQTTIDENT_PLATFORM_DARWIN 1
#elif defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#define MQTTIDENT_PLATFORM_WINDOWS 1
#elif defined(__linux__)
#define MQTTIDENT_PLATFORM_LINUX 1
#endif

#if !defined(MQTTIDENT_PLATFORM_EMBEDDED)
#include <filesystem>
#endif

// For hostname
#if !defined(MQTTIDENT_PLATFORM_WINDOWS) && !defined(MQTTIDENT_PLATFORM_EMBEDDED)
#include <unistd.h>
#endif

namespace mqttident {
namespace device {

namespace {

#if defined(MQTTIDENT_PLATFORM_DARWIN)

std::optional<std::string> cf_string_to_std(CFTypeRef ref) {
    if (ref == nullptr || CFGetTypeID(ref) != CFStringGetTypeID()) {
        return std::nullopt;
    }
    CFStringRef str = static_cast<CFStringRef>(ref);
    CFIndex length = CFStringGetLength(str);
    CFIndex max_size = CFStringGetMaximumSizeForEncoding(length, kCFStringEncodingUTF8) + 1;

    std::vector<char> buffer(static_cast<size_t>(max_size));
    if (!CFStringGetCString(str, buffer.data(), max_size, kCFStringEncodingUTF8)) {
        return std::nullopt;
    }
    return std::string(buffer.data());
}

std::optional<std::string> get_io_platform_property(const std::string& key) {
    io_registry_entry_t entry = IORegistryEntryFromPath(kIOMainPortDefault, "IOService:/");
    if (entry == 0) {
        return std::nullopt;
    }

    CFStringRef cf_key =
        CFStringCreateWithCString(kCFAllocatorDefault, key.c_str(), kCFStringEncodingUTF8);
    if (cf_key == nullptr) {
        IOObjectRelease(entry);
        return std::nullopt;
    }

    CFTypeRef value_ref =
        IORegistryEntryCreateCFProperty(entry, cf_key, kCFAllocatorDefault, 0);

    CFRelease(cf_key);
    IOObjectRelease(entry);

    if (value_ref == nullptr) {
        return std::nullopt;
    }

    auto result = cf_string_to_std(value_ref);
    CFRelease(value_ref);
    return result;
}

#endif

}  // namespace

// ==================== Platform ====================

Platform detect_platform() noexcept {
#if defined(MQTTIDENT_PLATFORM_EMBEDDED)
    return Platform::Embedded;
#elif defined(MQTTIDENT_PLATFORM_DARWIN)
    return Platform::Darwin;
#elif defined(MQTTIDENT_PLATFORM_WINDOWS)
    return Platform::Windows;
#elif defined(MQTTIDENT_PLATFORM_LINUX)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

std::string get_platform_name() { return platform_to_string(detect_platform()); }

std::optional<std::string> get_hostname() {
#if defined(MQTTIDENT_PLATFORM_WINDOWS)
    char hostname[MAX_COMPUTERNAME_LENGTH + 1] = {0};
    DWORD size = sizeof(hostname);
    if (GetComputerNameA(hostname, &size) && size > 0) {
        return std::string(hostname, size);
    }
#elif !defined(MQTTIDENT_PLATFORM_EMBEDDED)
    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) == 0 && hostname[0] != '\0') {
        return std::string(hostname);
    }
#endif
    return std::nullopt;
}

// ==================== SystemFactSource ====================

SystemFactSource::SystemFactSource(std::chrono::milliseconds command_timeout)
    : command_timeout_(command_timeout) {}

std::optional<std::string> SystemFactSource::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return content;
}

std::optional<std::vector<std::string>> SystemFactSource::list_directory(const std::string& path) {
#if defined(MQTTIDENT_PLATFORM_EMBEDDED)
    (void)path;
    return std::nullopt;
#else
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec) || ec) {
        return std::nullopt;
    }

    std::vector<std::string> names;
    std::filesystem::directory_iterator end;
    for (std::filesystem::directory_iterator it(path, ec); !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        return std::nullopt;
    }
    std::sort(names.begin(), names.end());
    return names;
#endif
}

std::optional<std::string> SystemFactSource::run_command(const std::vector<std::string>& argv) {
    return process::capture_output(argv, command_timeout_);
}

std::optional<std::string> SystemFactSource::registry_property(const std::string& key) {
#if defined(MQTTIDENT_PLATFORM_DARWIN)
    return get_io_platform_property(key);
#else
    (void)key;
    return std::nullopt;
#endif
}

std::optional<std::vector<uint8_t>> SystemFactSource::board_unique_id() {
#if defined(ESP_PLATFORM)
    // Factory base MAC burned into eFuse
    std::vector<uint8_t> base_mac(6, 0);
    if (esp_efuse_mac_get_default(base_mac.data()) == ESP_OK) {
        return base_mac;
    }
#endif
    return std::nullopt;
}

std::vector<std::vector<uint8_t>> SystemFactSource::board_interface_macs() {
    std::vector<std::vector<uint8_t>> macs;
#if defined(ESP_PLATFORM)
    for (esp_mac_type_t type : {ESP_MAC_WIFI_STA, ESP_MAC_WIFI_SOFTAP}) {
        std::vector<uint8_t> mac(6, 0);
        if (esp_read_mac(mac.data(), type) == ESP_OK) {
            macs.push_back(std::move(mac));
        }
    }
#endif
    return macs;
}

// ==================== MemoryFactSource ====================

void MemoryFactSource::set_file(const std::string& path, std::string content) {
    files_[path] = std::move(content);
}

void MemoryFactSource::set_command_output(const std::vector<std::string>& argv,
                                          std::string output) {
    commands_[argv] = std::move(output);
}

void MemoryFactSource::set_registry_property(const std::string& key, std::string value) {
    registry_[key] = std::move(value);
}

void MemoryFactSource::set_board_unique_id(std::vector<uint8_t> id) {
    board_unique_id_ = std::move(id);
}

void MemoryFactSource::add_board_interface_mac(std::vector<uint8_t> mac) {
    board_macs_.push_back(std::move(mac));
}

std::optional<std::string> MemoryFactSource::read_file(const std::string& path) {
    auto it = files_.find(path);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::vector<std::string>> MemoryFactSource::list_directory(const std::string& path) {
    std::string prefix = path;
    if (prefix.empty() || prefix.back() != '/') {
        prefix.push_back('/');
    }

    // "a-b/..." sorts between "a" and "a/...", so names are not adjacent
    std::set<std::string> names;
    for (const auto& [file_path, content] : files_) {
        if (file_path.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        std::string rest = file_path.substr(prefix.size());
        std::string name = rest.substr(0, rest.find('/'));
        if (!name.empty()) {
            names.insert(std::move(name));
        }
    }
    if (names.empty()) {
        return std::nullopt;
    }
    return std::vector<std::string>(names.begin(), names.end());
}

std::optional<std::string> MemoryFactSource::run_command(const std::vector<std::string>& argv) {
    command_log_.push_back(argv);
    auto it = commands_.find(argv);
    if (it == commands_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> MemoryFactSource::registry_property(const std::string& key) {
    auto it = registry_.find(key);
    if (it == registry_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::vector<uint8_t>> MemoryFactSource::board_unique_id() { return board_unique_id_; }

std::vector<std::vector<uint8_t>> MemoryFactSource::board_interface_macs() { return board_macs_; }

}  // namespace device
}  // namespace mqttident
