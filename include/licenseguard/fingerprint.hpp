#pragma once

/**
 * @file fingerprint.hpp
 * @brief Device fingerprint generation and comparison
 */

#include "device.hpp"
#include "licenseguard.hpp"

#include <memory>

namespace licenseguard {

/**
 * @brief Builds and compares composite device fingerprints
 *
 * Primary identifiers (machine id, platform, arch) must match exactly.
 * Secondary identifiers (hostname, MAC addresses, CPU) tolerate drift:
 * only those present on both sides are counted, and a two-thirds majority
 * of them must agree, so a renamed host alone does not lock the owner out.
 */
class FingerprintEngine {
  public:
    /// Minimum share of comparable secondary fields that must agree
    static constexpr double kSecondaryMatchThreshold = 2.0 / 3.0;

    explicit FingerprintEngine(std::shared_ptr<DeviceInfoProvider> provider);

    /// Query the provider and compute the device signature
    [[nodiscard]] DeviceFingerprint generate() const;

    /**
     * @brief Decide whether two fingerprints describe the same device
     *
     * MAC addresses agree when the two sets share at least one address.
     * When no secondary field is comparable, the primary identifiers decide.
     */
    [[nodiscard]] static bool compare(const DeviceFingerprint& a, const DeviceFingerprint& b) noexcept;

    /**
     * @brief SHA-256 hex over all fields, primary identifiers hashed first
     *
     * The primary identifiers are digested separately and that digest leads
     * the outer payload, so they dominate the resulting signature.
     */
    [[nodiscard]] static std::string compute_device_signature(const DeviceFingerprint& fp);

    /// Display-safe summary (truncated identifiers)
    [[nodiscard]] static DeviceInfoSummary summarize(const DeviceFingerprint& fp);

  private:
    std::shared_ptr<DeviceInfoProvider> provider_;
};

}  // namespace licenseguard
