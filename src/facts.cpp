#include "mqttident/facts.hpp"

#include "string_util.hpp"

#include <cctype>
#include <cstdio>

namespace mqttident {
namespace facts {

namespace {

using detail::contains;
using detail::split;
using detail::split_lines;
using detail::split_whitespace;
using detail::starts_with;
using detail::to_lower;
using detail::trim;

constexpr const char* kNetClassDir = "/sys/class/net";
constexpr const char* kBluetoothClassDir = "/sys/class/bluetooth";

// Checked in order; the first non-empty value wins
constexpr const char* kLinuxSerialFiles[] = {
    "/sys/class/dmi/id/product_serial",
    "/sys/firmware/devicetree/base/serial-number",
    "/proc/device-tree/serial-number",
};

constexpr const char* kCpuInfoFile = "/proc/cpuinfo";

std::string describe(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += arg;
    }
    return joined;
}

/// Run a command through the context, reporting absence
std::optional<std::string> command_output(ProbeContext& ctx, const std::vector<std::string>& argv) {
    auto output = ctx.source().run_command(argv);
    if (!output) {
        ctx.absent(describe(argv), "command unavailable or failed");
    }
    return output;
}

/// Add `value` as `kind` if it normalizes (and is global when required)
void add_address(ConnectionSet& out, const char* kind, const std::string& value, bool require_global) {
    auto mac = normalize_mac(value);
    if (!mac) {
        return;
    }
    if (require_global && !is_global_mac(*mac)) {
        return;
    }
    out.insert(Connection{kind, *mac});
}

/// Text after the first ':' of a "Key: value" line
std::string value_after_colon(const std::string& line) {
    auto pos = line.find(':');
    if (pos == std::string::npos) {
        return "";
    }
    return trim(line.substr(pos + 1));
}

std::string strip_quotes(std::string value) {
    while (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
        value.erase(value.begin());
    }
    while (!value.empty() && (value.back() == '"' || value.back() == '\'')) {
        value.pop_back();
    }
    return value;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

}  // namespace

// ==================== Address Normalization ====================

std::optional<std::string> normalize_mac(const std::string& value) {
    std::string raw;
    raw.reserve(12);
    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
            raw.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (raw.size() != 12) {
        return std::nullopt;
    }
    for (char c : raw) {
        if (hex_value(c) < 0) {
            return std::nullopt;
        }
    }

    std::string mac;
    mac.reserve(17);
    for (size_t i = 0; i < raw.size(); i += 2) {
        if (i > 0) {
            mac.push_back(':');
        }
        mac.append(raw, i, 2);
    }
    return mac;
}

std::optional<std::string> mac_from_bytes(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != 6) {
        return std::nullopt;
    }
    char buffer[18];
    std::snprintf(buffer, sizeof(buffer), "%02x:%02x:%02x:%02x:%02x:%02x", bytes[0], bytes[1],
                  bytes[2], bytes[3], bytes[4], bytes[5]);
    return std::string(buffer);
}

bool is_global_mac(const std::string& mac) noexcept {
    if (mac.size() < 2) {
        return false;
    }
    int high = hex_value(static_cast<char>(std::tolower(static_cast<unsigned char>(mac[0]))));
    int low = hex_value(static_cast<char>(std::tolower(static_cast<unsigned char>(mac[1]))));
    if (high < 0 || low < 0) {
        return false;
    }
    int first_octet = (high << 4) | low;
    return (first_octet & 0x01) == 0 && (first_octet & 0x02) == 0;
}

bool is_placeholder_mac(const std::string& mac) noexcept {
    return mac == "00:00:00:00:00:00" || mac == "ff:ff:ff:ff:ff:ff";
}

std::vector<Connection> normalize_connections(const ConnectionSet& connections) {
    ConnectionSet out;
    for (const auto& conn : connections) {
        if (conn.kind.empty()) {
            continue;
        }
        auto mac = normalize_mac(conn.address);
        if (!mac || is_placeholder_mac(*mac)) {
            continue;
        }
        if (conn.kind == connection_kind::MAC) {
            // Virtual and locally administered adapters are not stable
            if (is_global_mac(*mac)) {
                out.insert(Connection{connection_kind::MAC, *mac});
            }
        } else if (conn.kind == connection_kind::BLUETOOTH) {
            out.insert(Connection{connection_kind::BLUETOOTH, *mac});
        }
    }
    return std::vector<Connection>(out.begin(), out.end());
}

std::vector<Connection> normalize_connections(const std::vector<Connection>& connections) {
    return normalize_connections(ConnectionSet(connections.begin(), connections.end()));
}

// ==================== ProbeContext ====================

void ProbeContext::absent(const std::string& source, const std::string& detail) {
    emit_event(events_, events::PROBE_SOURCE_ABSENT,
               ProbeEvent{device::platform_to_string(platform_), source, detail});
}

// ==================== Embedded ====================

std::optional<std::string> EmbeddedProbe::serial_number(ProbeContext& ctx) const {
    auto uid = ctx.source().board_unique_id();
    if (!uid || uid->empty()) {
        ctx.absent("board unique id", "not available");
        return std::nullopt;
    }

    std::string hex;
    hex.reserve(uid->size() * 2);
    char buffer[3];
    for (uint8_t byte : *uid) {
        std::snprintf(buffer, sizeof(buffer), "%02x", byte);
        hex += buffer;
    }
    return hex;
}

ConnectionSet EmbeddedProbe::connections(ProbeContext& ctx) const {
    ConnectionSet out;
    for (const auto& bytes : ctx.source().board_interface_macs()) {
        auto mac = mac_from_bytes(bytes);
        if (mac) {
            add_address(out, connection_kind::MAC, *mac, true);
        }
    }
    if (out.empty()) {
        ctx.absent("wifi interfaces", "no global address");
    }
    return out;
}

// ==================== Linux ====================

std::optional<std::string> LinuxProbe::serial_number(ProbeContext& ctx) const {
    for (const char* path : kLinuxSerialFiles) {
        auto content = ctx.source().read_file(path);
        if (!content) {
            ctx.absent(path, "missing or unreadable");
            continue;
        }
        std::string value = detail::trim_with_nul(*content);
        if (!value.empty()) {
            return value;
        }
    }

    auto cpuinfo = ctx.source().read_file(kCpuInfoFile);
    if (!cpuinfo) {
        ctx.absent(kCpuInfoFile, "missing or unreadable");
        return std::nullopt;
    }
    for (const auto& line : split_lines(*cpuinfo)) {
        if (!starts_with(to_lower(line), "serial")) {
            continue;
        }
        auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }
        std::string value = trim(line.substr(pos + 1));
        if (!value.empty()) {
            return value;
        }
    }
    ctx.absent(kCpuInfoFile, "no Serial line");
    return std::nullopt;
}

ConnectionSet LinuxProbe::connections(ProbeContext& ctx) const {
    ConnectionSet out;
    auto& source = ctx.source();

    auto interfaces = source.list_directory(kNetClassDir);
    if (interfaces) {
        for (const auto& name : *interfaces) {
            auto address = source.read_file(std::string(kNetClassDir) + "/" + name + "/address");
            if (address) {
                add_address(out, connection_kind::MAC, trim(*address), true);
            }
        }
    } else {
        ctx.absent(kNetClassDir, "missing");
    }

    // A Bluetooth address is only trusted with a positive public-address signal
    auto info = command_output(ctx, {"btmgmt", "info"});
    const bool is_public = info && contains(to_lower(*info), "public address");

    auto controllers = source.list_directory(kBluetoothClassDir);
    if (controllers) {
        for (const auto& name : *controllers) {
            auto address =
                source.read_file(std::string(kBluetoothClassDir) + "/" + name + "/address");
            if (address && is_public) {
                add_address(out, connection_kind::BLUETOOTH, trim(*address), false);
            }
        }
        if (!is_public) {
            ctx.absent(kBluetoothClassDir, "no public address signal");
        }
        return out;
    }

    auto show = command_output(ctx, {"bluetoothctl", "show"});
    if (!show) {
        return out;
    }
    for (const auto& line : split_lines(*show)) {
        auto parts = split_whitespace(line);
        if (parts.size() < 2 || parts[0] != "Controller") {
            continue;
        }
        if (is_public || contains(to_lower(line), "(public)")) {
            add_address(out, connection_kind::BLUETOOTH, parts[1], false);
        }
    }
    return out;
}

// ==================== Darwin ====================

std::optional<std::string> DarwinProbe::serial_number(ProbeContext& ctx) const {
    auto registry = ctx.source().registry_property("IOPlatformSerialNumber");
    if (registry) {
        std::string value = trim(*registry);
        if (!value.empty()) {
            return value;
        }
    }
    ctx.absent("IOPlatformSerialNumber", "registry property unavailable");

    auto output = command_output(ctx, {"ioreg", "-rd1", "-c", "IOPlatformExpertDevice"});
    if (!output) {
        return std::nullopt;
    }
    for (const auto& line : split_lines(*output)) {
        if (!contains(line, "IOPlatformSerialNumber")) {
            continue;
        }
        auto parts = split(line, '=');
        if (parts.size() < 2) {
            continue;
        }
        std::string value = strip_quotes(trim(parts[1]));
        if (!value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

ConnectionSet DarwinProbe::connections(ProbeContext& ctx) const {
    ConnectionSet out;

    auto ports = command_output(ctx, {"networksetup", "-listallhardwareports"});
    if (ports) {
        for (const auto& raw : split_lines(*ports)) {
            std::string line = trim(raw);
            if (starts_with(to_lower(line), "ethernet address")) {
                add_address(out, connection_kind::MAC, value_after_colon(line), true);
            }
        }
    }

    // Only the first controller address is considered
    auto profile = command_output(ctx, {"system_profiler", "SPBluetoothDataType"});
    if (profile) {
        for (const auto& raw : split_lines(*profile)) {
            std::string line = trim(raw);
            if (!starts_with(to_lower(line), "address:")) {
                continue;
            }
            auto mac = normalize_mac(value_after_colon(line));
            if (mac && is_global_mac(*mac)) {
                out.insert(Connection{connection_kind::BLUETOOTH, *mac});
                break;
            }
        }
    }
    return out;
}

// ==================== Windows ====================

std::optional<std::string> WindowsProbe::serial_number(ProbeContext& ctx) const {
    auto cim = command_output(
        ctx, {"powershell", "-NoProfile", "-Command", "(Get-CimInstance Win32_BIOS).SerialNumber"});
    if (cim) {
        std::string value = trim(*cim);
        if (!value.empty()) {
            return value;
        }
    }

    // Legacy fallback: header line followed by the value
    auto wmic = command_output(ctx, {"wmic", "bios", "get", "serialnumber"});
    if (!wmic) {
        return std::nullopt;
    }
    std::vector<std::string> rows;
    for (const auto& line : split_lines(*wmic)) {
        std::string value = trim(line);
        if (!value.empty()) {
            rows.push_back(std::move(value));
        }
    }
    if (rows.size() > 1) {
        return rows[1];
    }
    return std::nullopt;
}

ConnectionSet WindowsProbe::connections(ProbeContext& ctx) const {
    ConnectionSet out;

    auto getmac = command_output(ctx, {"getmac", "/v", "/fo", "csv"});
    if (getmac) {
        for (const auto& line : split_lines(*getmac)) {
            if (!contains(line, ",")) {
                continue;
            }
            for (const auto& cell : split(line, ',')) {
                add_address(out, connection_kind::MAC, strip_quotes(trim(cell)), true);
            }
        }
    }

    bool has_bluetooth = false;
    for (const auto& conn : out) {
        if (conn.kind == connection_kind::BLUETOOTH) {
            has_bluetooth = true;
            break;
        }
    }
    if (has_bluetooth) {
        return out;
    }

    // Node,MACAddress,Name
    auto nics = command_output(ctx, {"wmic", "nic", "get", "Name,MACAddress", "/format:csv"});
    if (!nics) {
        return out;
    }
    for (const auto& row : split_lines(*nics)) {
        auto cols = split(row, ',');
        if (cols.size() < 3) {
            continue;
        }
        if (contains(to_lower(trim(cols[2])), "bluetooth")) {
            add_address(out, connection_kind::BLUETOOTH, trim(cols[1]), true);
        }
    }
    return out;
}

// ==================== Collection ====================

PlatformProbe select_probe(device::Platform platform) noexcept {
    switch (platform) {
        case device::Platform::Embedded:
            return EmbeddedProbe{};
        case device::Platform::Linux:
            return LinuxProbe{};
        case device::Platform::Darwin:
            return DarwinProbe{};
        case device::Platform::Windows:
            return WindowsProbe{};
        case device::Platform::Unknown:
            return NoFactsProbe{};
    }
    return NoFactsProbe{};
}

DeviceFacts collect_device_facts(device::Platform platform, device::FactSource& source,
                                 EventBus* events) {
    emit_event(events, events::PROBE_START, std::string(device::platform_to_string(platform)));

    ProbeContext ctx(source, platform, events);
    DeviceFacts result;
    ConnectionSet raw;

    std::visit(
        [&](const auto& probe) {
            result.serial_number = probe.serial_number(ctx);
            raw = probe.connections(ctx);
        },
        select_probe(platform));

    result.connections = normalize_connections(raw);

    emit_event(events, events::PROBE_COMPLETE, result);
    return result;
}

DeviceFacts collect_device_facts(EventBus* events) {
    device::SystemFactSource source;
    return collect_device_facts(device::detect_platform(), source, events);
}

}  // namespace facts
}  // namespace mqttident
