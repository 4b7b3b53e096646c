#pragma once

/**
 * @file device.hpp
 * @brief Device information providers for LicenseGuard
 *
 * Isolates the OS-specific queries behind DeviceInfoProvider so fingerprint
 * comparison stays pure and testable.
 */

#include <string>
#include <vector>

namespace licenseguard {

/**
 * @brief Capability interface for raw device attributes
 *
 * Implementations return an empty string (or empty list) for attributes
 * they cannot determine; they never throw.
 */
class DeviceInfoProvider {
  public:
    virtual ~DeviceInfoProvider() = default;

    /// Stable OS installation identifier, hashed
    [[nodiscard]] virtual std::string machine_id() const = 0;

    /// "linux", "macos", "windows" or "unknown"
    [[nodiscard]] virtual std::string platform() const = 0;

    /// CPU architecture ("x64", "arm64", ...)
    [[nodiscard]] virtual std::string arch() const = 0;

    [[nodiscard]] virtual std::string hostname() const = 0;

    /// Non-loopback, non-zero MAC addresses, lowercase, sorted
    [[nodiscard]] virtual std::vector<std::string> mac_addresses() const = 0;

    /// CPU model and core count ("<model>-<cores>")
    [[nodiscard]] virtual std::string cpu_info() const = 0;

    /// Total memory in whole GiB
    [[nodiscard]] virtual std::string memory_info() const = 0;

    /// Kernel / OS release string
    [[nodiscard]] virtual std::string os_release() const = 0;
};

/**
 * @brief Provider backed by the host operating system
 *
 * - macOS: IOPlatformUUID, sysctl, getifaddrs
 * - Linux: /etc/machine-id, /proc, /sys/class/net, uname
 * - Windows: MachineGuid, GetAdaptersAddresses, GlobalMemoryStatusEx
 */
class SystemDeviceInfoProvider : public DeviceInfoProvider {
  public:
    [[nodiscard]] std::string machine_id() const override;
    [[nodiscard]] std::string platform() const override;
    [[nodiscard]] std::string arch() const override;
    [[nodiscard]] std::string hostname() const override;
    [[nodiscard]] std::vector<std::string> mac_addresses() const override;
    [[nodiscard]] std::string cpu_info() const override;
    [[nodiscard]] std::string memory_info() const override;
    [[nodiscard]] std::string os_release() const override;
};

namespace device {

/**
 * @brief Generate a stable identifier for the OS installation
 *
 * The raw platform UUID / machine-id is hashed with SHA-256 and truncated to
 * 32 hex chars, so the raw value never leaves this function.
 *
 * @return The identifier, or empty string on failure
 */
[[nodiscard]] std::string generate_machine_id();

/// "macos", "linux", "windows", or "unknown"
[[nodiscard]] std::string get_platform_name();

/// Normalized CPU architecture name
[[nodiscard]] std::string get_arch_name();

/// The system hostname or "unknown" on failure
[[nodiscard]] std::string get_hostname();

/// Normalize a MAC address to lowercase colon form; empty for zero/invalid input
[[nodiscard]] std::string normalize_mac(const std::string& mac);

}  // namespace device
}  // namespace licenseguard
