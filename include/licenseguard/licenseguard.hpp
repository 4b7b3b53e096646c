#pragma once

/**
 * @file licenseguard.hpp
 * @brief LicenseGuard offline licensing engine
 *
 * Offline license activation and validation for desktop applications.
 * Keys are HMAC-signed JSON blobs bound to a device fingerprint on activation;
 * no server is ever contacted.
 */

#include <any>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace licenseguard {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Free-form string metadata carried by license keys
using Metadata = std::map<std::string, std::string>;

/// Timestamp type used throughout the engine
using Timestamp = std::chrono::system_clock::time_point;

/// Error codes surfaced to callers
enum class ErrorCode {
    Success = 0,

    // Format errors
    InvalidKey,

    // Cryptographic errors
    SignatureInvalid,
    Tampered,

    // Temporal errors
    Expired,

    // Policy errors
    DeviceMismatch,
    LicenseAlreadyRegistered,
    LicenseAlreadyActivatedOnThisDevice,
    LicensePermanentlyDeactivated,
    NotActivated,

    // Storage errors
    StorageError,

    Unknown
};

/// Alias kept for hosts that still use the older name
constexpr ErrorCode AlreadyActivated = ErrorCode::LicenseAlreadyRegistered;

/// Convert error code to its wire name (e.g. "SIGNATURE_INVALID")
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "SUCCESS";
        case ErrorCode::InvalidKey:
            return "INVALID_KEY";
        case ErrorCode::SignatureInvalid:
            return "SIGNATURE_INVALID";
        case ErrorCode::Tampered:
            return "TAMPERED";
        case ErrorCode::Expired:
            return "EXPIRED";
        case ErrorCode::DeviceMismatch:
            return "DEVICE_MISMATCH";
        case ErrorCode::LicenseAlreadyRegistered:
            return "LICENSE_ALREADY_REGISTERED";
        case ErrorCode::LicenseAlreadyActivatedOnThisDevice:
            return "LICENSE_ALREADY_ACTIVATED_ON_THIS_DEVICE";
        case ErrorCode::LicensePermanentlyDeactivated:
            return "LICENSE_PERMANENTLY_DEACTIVATED";
        case ErrorCode::NotActivated:
            return "NOT_ACTIVATED";
        case ErrorCode::StorageError:
            return "STORAGE_ERROR";
        case ErrorCode::Unknown:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

/// Human-readable, actionable description of an error code
[[nodiscard]] constexpr const char* error_code_description(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::InvalidKey:
            return "The license key is not valid. Check the key and enter it again.";
        case ErrorCode::SignatureInvalid:
            return "The license key signature is invalid. Contact support for a new key.";
        case ErrorCode::Tampered:
            return "The license record has been modified. Activate the license again.";
        case ErrorCode::Expired:
            return "The license has expired. Obtain a new key to continue.";
        case ErrorCode::DeviceMismatch:
            return "The license is bound to a different device.";
        case ErrorCode::LicenseAlreadyRegistered:
            return "This license is already activated on another device. Deactivate it on the "
                   "original device or obtain a new key.";
        case ErrorCode::LicenseAlreadyActivatedOnThisDevice:
            return "This license is already active on this device.";
        case ErrorCode::LicensePermanentlyDeactivated:
            return "This license was deactivated and can no longer be used. Obtain a new key.";
        case ErrorCode::NotActivated:
            return "No license is activated on this device.";
        case ErrorCode::StorageError:
            return "The license data could not be read or written.";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/// License tiers a key can be issued for
enum class LicenseType { Trial, Standard, Premium, Enterprise };

[[nodiscard]] constexpr const char* license_type_to_string(LicenseType type) noexcept {
    switch (type) {
        case LicenseType::Trial:
            return "trial";
        case LicenseType::Standard:
            return "standard";
        case LicenseType::Premium:
            return "premium";
        case LicenseType::Enterprise:
            return "enterprise";
    }
    return "standard";
}

/// Parse license type from its key string; nullopt for unknown values
[[nodiscard]] inline std::optional<LicenseType> license_type_from_string(
    const std::string& str) noexcept {
    if (str == "trial")
        return LicenseType::Trial;
    if (str == "standard")
        return LicenseType::Standard;
    if (str == "premium")
        return LicenseType::Premium;
    if (str == "enterprise")
        return LicenseType::Enterprise;
    return std::nullopt;
}

/// Outcome of validating the stored activation
enum class LicenseStatus {
    NotActivated,
    Valid,
    Expired,
    Invalid,
    DeviceMismatch,
    Tampered,
    Deactivated
};

[[nodiscard]] constexpr const char* license_status_to_string(LicenseStatus status) noexcept {
    switch (status) {
        case LicenseStatus::NotActivated:
            return "not_activated";
        case LicenseStatus::Valid:
            return "valid";
        case LicenseStatus::Expired:
            return "expired";
        case LicenseStatus::Invalid:
            return "invalid";
        case LicenseStatus::DeviceMismatch:
            return "device_mismatch";
        case LicenseStatus::Tampered:
            return "tampered";
        case LicenseStatus::Deactivated:
            return "deactivated";
    }
    return "invalid";
}

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = message.empty() ? error_code_description(code) : std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() {
        Result r;
        r.error_ = ErrorCode::Success;
        return r;
    }

    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = message.empty() ? error_code_description(code) : std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/**
 * @brief License data as issued inside a key
 *
 * Immutable once issued. Only license_id, license_type, max_days and
 * created_at are covered by the signature.
 */
struct RawLicenseData {
    std::string license_id;
    LicenseType license_type = LicenseType::Standard;
    int max_days = 0;
    std::string created_at;  // ISO-8601, kept verbatim for signature checks
    std::string signature;   // Hex HMAC-SHA256
    std::vector<std::string> features;
    Metadata metadata;
};

/**
 * @brief Composite device identity
 *
 * machine_id, platform and arch are primary and must match exactly.
 * The remaining fields are secondary and compared fuzzily.
 */
struct DeviceFingerprint {
    std::string machine_id;
    std::string platform;
    std::string arch;
    std::string hostname;
    std::vector<std::string> mac_addresses;
    std::string cpu_info;
    std::string memory_info;
    std::string os_release;
    std::string device_signature;  // SHA-256 over all fields

    /// First MAC address, or empty if none was found
    [[nodiscard]] std::string primary_mac() const {
        return mac_addresses.empty() ? std::string() : mac_addresses.front();
    }
};

/**
 * @brief The single activation record persisted on a device
 */
struct ActivatedLicenseData : RawLicenseData {
    Timestamp activated_at;
    Timestamp expires_at;
    DeviceFingerprint device_fingerprint;  // Snapshot taken at activation, never overwritten
    std::string original_signature;
    std::string activation_seal;           // HMAC over the activation window and snapshot
    std::optional<Timestamp> last_checked;
};

/**
 * @brief Registry binding of a license id to a device
 *
 * Once deactivated is set it is never cleared.
 */
struct RegistryEntry {
    std::string license_id;
    std::string device_signature;
    Timestamp activated_at;
    bool deactivated = false;
    std::optional<Timestamp> deactivated_at;
    int activation_count = 0;
};

/**
 * @brief Result of validating the stored activation
 */
struct LicenseValidationResult {
    LicenseStatus status = LicenseStatus::NotActivated;
    int remaining_days = 0;
    bool is_expiring_soon = false;
    std::string error;
    std::optional<ErrorCode> error_code;
    std::optional<Timestamp> expires_at;

    [[nodiscard]] bool is_valid() const noexcept { return status == LicenseStatus::Valid; }
};

/**
 * @brief Display-safe summary of the current device
 */
struct DeviceInfoSummary {
    std::string machine_id;  // Truncated
    std::string platform;
    std::string arch;
    std::string hostname;
    std::string mac_address;  // Truncated to the vendor prefix
    std::string cpu_info;
    std::string memory_info;
    std::string os_release;
    std::string device_signature;  // Truncated
};

/**
 * @brief License details for settings/about screens
 */
struct LicenseInfo {
    std::string license_id;
    LicenseType license_type = LicenseType::Standard;
    Timestamp activated_at;
    Timestamp expires_at;
    int remaining_days = 0;
    bool is_expiring_soon = false;
    std::vector<std::string> features;
    LicenseStatus status = LicenseStatus::NotActivated;
    std::string device_id;  // Truncated machine id of the bound device
    std::string error;
};

/// Outcome of ActivationService::activate
struct ActivationOutcome {
    bool success = false;
    std::optional<ActivatedLicenseData> license;
    std::string error;
    std::optional<ErrorCode> error_code;
};

/// Outcome of ActivationService::deactivate
struct DeactivationOutcome {
    bool success = false;
    std::string error;
    std::optional<ErrorCode> error_code;
};

/**
 * @brief Configuration for the activation service
 */
struct Config {
    /// Private HMAC key used to sign license keys (required)
    std::string signing_key;

    /// Directory for the activation record and registry (empty = in-memory only)
    std::string storage_path;

    /// Storage prefix for file names
    std::string storage_prefix = "licenseguard";

    /// Days before expiry at which a license is reported as expiring soon
    int warning_days = 7;

    /// Interval for periodic re-validation in seconds (0 to disable)
    double check_interval_seconds = 10.0;

    /// Enable debug logging
    bool debug = false;
};

class Guard;
using EventHandler = std::function<void(const std::any&)>;

/**
 * @brief Subscription handle for event unsubscription
 */
class Subscription {
  public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe) : unsubscribe_(std::move(unsubscribe)) {}

    /// Cancel this subscription
    void cancel() {
        if (unsubscribe_) {
            unsubscribe_();
            unsubscribe_ = nullptr;
        }
    }

    [[nodiscard]] bool is_active() const { return unsubscribe_ != nullptr; }

  private:
    std::function<void()> unsubscribe_;
};

/**
 * @brief Host-facing facade over the licensing engine
 *
 * Wires file-backed storage and registry, the system device provider and
 * a Guard from a Config, and reports outcomes in a UI-friendly shape.
 *
 * Thread Safety: All public methods are thread-safe.
 *
 * ```cpp
 * licenseguard::Config config;
 * config.signing_key = "...";
 * config.storage_path = app_data_dir;
 * licenseguard::ActivationService service(config);
 *
 * if (!service.verify_license().is_valid()) {
 *     auto outcome = service.activate(key_from_dialog);
 * }
 * ```
 */
class ActivationService {
  public:
    /// Construct a service with system device info and file storage from config
    explicit ActivationService(Config config);

    /// Construct a service around an already assembled guard
    ActivationService(Config config, std::unique_ptr<Guard> guard);

    ~ActivationService();

    ActivationService(const ActivationService&) = delete;
    ActivationService& operator=(const ActivationService&) = delete;

    ActivationService(ActivationService&&) noexcept;
    ActivationService& operator=(ActivationService&&) noexcept;

    /// Validate the stored activation against this device and the current time
    [[nodiscard]] LicenseValidationResult verify_license();

    /// True only when verify_license() reports VALID
    [[nodiscard]] bool can_proceed();

    /// Activate a license key on this device
    [[nodiscard]] ActivationOutcome activate(const std::string& license_key);

    /// Release the license binding and erase the local activation
    [[nodiscard]] DeactivationOutcome deactivate();

    /// Display-safe summary of this device's fingerprint
    [[nodiscard]] DeviceInfoSummary get_current_device_info() const;

    /// Details of the stored license, if any
    [[nodiscard]] std::optional<LicenseInfo> get_license_info();

    /// True when no activation record exists yet
    [[nodiscard]] bool is_first_run() const;

    /// Start periodic re-validation on a background timer
    void start_auto_validation();

    /// Stop periodic re-validation
    void stop_auto_validation();

    [[nodiscard]] bool is_auto_validating() const;

    /// Subscribe to engine events (see events.hpp); handlers must not destroy the service
    Subscription on(const std::string& event, EventHandler handler);

    [[nodiscard]] const Config& config() const noexcept;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace licenseguard
