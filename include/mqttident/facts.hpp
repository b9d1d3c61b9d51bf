#pragma once

/**
 * @file facts.hpp
 * @brief Best-effort collection of device facts
 *
 * Each supported runtime has one probe. A probe reads only through a
 * FactSource and reports every step as present or absent; collection never
 * fails, it only yields fewer facts.
 */

#include "mqttident/device.hpp"
#include "mqttident/events.hpp"
#include "mqttident/mqttident.hpp"

#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace mqttident {
namespace facts {

/// Connections gathered during probing (duplicates collapse)
using ConnectionSet = std::set<Connection>;

// ==================== Address Normalization ====================

/**
 * @brief Normalize a MAC-like string to "aa:bb:cc:dd:ee:ff"
 *
 * Non-alphanumeric characters are removed; the rest must be exactly 12 hex
 * digits.
 *
 * @return The canonical address, or nullopt if the input is not a MAC
 */
[[nodiscard]] std::optional<std::string> normalize_mac(const std::string& value);

/// Format raw address bytes (must be 6) as a canonical MAC
[[nodiscard]] std::optional<std::string> mac_from_bytes(const std::vector<uint8_t>& bytes);

/// True when both the multicast (0x01) and locally-administered (0x02) bits are clear
[[nodiscard]] bool is_global_mac(const std::string& mac) noexcept;

/// True for the all-zero and broadcast placeholder addresses
[[nodiscard]] bool is_placeholder_mac(const std::string& mac) noexcept;

/**
 * @brief Apply the normalization rules to a set of raw connections
 *
 * Addresses are normalized, placeholders dropped, "mac" entries kept only if
 * globally administered, "bluetooth" entries passed through, other kinds
 * discarded.
 */
[[nodiscard]] std::vector<Connection> normalize_connections(const ConnectionSet& connections);

/// Overload for caller-supplied lists
[[nodiscard]] std::vector<Connection> normalize_connections(const std::vector<Connection>& connections);

// ==================== Probes ====================

/**
 * @brief State shared by the steps of one probe run
 */
class ProbeContext {
  public:
    ProbeContext(device::FactSource& source, device::Platform platform, EventBus* events = nullptr)
        : source_(source), platform_(platform), events_(events) {}

    [[nodiscard]] device::FactSource& source() noexcept { return source_; }
    [[nodiscard]] device::Platform platform() const noexcept { return platform_; }

    /// Record that a source yielded nothing usable
    void absent(const std::string& source, const std::string& detail);

  private:
    device::FactSource& source_;
    device::Platform platform_;
    EventBus* events_;
};

/// Board unique id and Wi-Fi interface MACs of a constrained runtime
struct EmbeddedProbe {
    static constexpr device::Platform platform = device::Platform::Embedded;
    [[nodiscard]] std::optional<std::string> serial_number(ProbeContext& ctx) const;
    [[nodiscard]] ConnectionSet connections(ProbeContext& ctx) const;
};

/// sysfs, device-tree, /proc/cpuinfo and the BlueZ tools
struct LinuxProbe {
    static constexpr device::Platform platform = device::Platform::Linux;
    [[nodiscard]] std::optional<std::string> serial_number(ProbeContext& ctx) const;
    [[nodiscard]] ConnectionSet connections(ProbeContext& ctx) const;
};

/// IORegistry, networksetup and system_profiler
struct DarwinProbe {
    static constexpr device::Platform platform = device::Platform::Darwin;
    [[nodiscard]] std::optional<std::string> serial_number(ProbeContext& ctx) const;
    [[nodiscard]] ConnectionSet connections(ProbeContext& ctx) const;
};

/// getmac, WMI NIC enumeration and the BIOS serial
struct WindowsProbe {
    static constexpr device::Platform platform = device::Platform::Windows;
    [[nodiscard]] std::optional<std::string> serial_number(ProbeContext& ctx) const;
    [[nodiscard]] ConnectionSet connections(ProbeContext& ctx) const;
};

/// Unknown runtime: no facts
struct NoFactsProbe {
    static constexpr device::Platform platform = device::Platform::Unknown;
    [[nodiscard]] std::optional<std::string> serial_number(ProbeContext& /*ctx*/) const {
        return std::nullopt;
    }
    [[nodiscard]] ConnectionSet connections(ProbeContext& /*ctx*/) const { return {}; }
};

/// Closed set of probes, one per platform
using PlatformProbe = std::variant<EmbeddedProbe, LinuxProbe, DarwinProbe, WindowsProbe, NoFactsProbe>;

/// Pick the probe for a platform (Unknown maps to NoFactsProbe)
[[nodiscard]] PlatformProbe select_probe(device::Platform platform) noexcept;

// ==================== Collection ====================

/**
 * @brief Run the probe for `platform` against `source`
 *
 * The returned connections are normalized and deduplicated; their order is
 * unspecified.
 */
[[nodiscard]] DeviceFacts collect_device_facts(device::Platform platform, device::FactSource& source,
                                               EventBus* events = nullptr);

/**
 * @brief Collect facts from the running system
 *
 * Detects the platform and probes it through a SystemFactSource.
 */
[[nodiscard]] DeviceFacts collect_device_facts(EventBus* events = nullptr);

}  // namespace facts
}  // namespace mqttident
