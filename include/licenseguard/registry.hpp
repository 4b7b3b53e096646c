#pragma once

/**
 * @file registry.hpp
 * @brief Local registry binding license ids to device signatures
 *
 * The registry is local to one installation. It stops this installation
 * from silently re-binding a key to a different device, and it remembers
 * deactivations forever. It is not a multi-machine enforcement mechanism.
 */

#include "licenseguard.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace licenseguard {

/// What register_license() did on success
enum class RegistrationOutcome {
    Created,      ///< New entry bound to the device
    AlreadyBound  ///< Entry already bound to the same device (idempotent)
};

/**
 * @brief Registry interface
 *
 * register_license() semantics:
 * - no entry: create one bound to device_signature
 * - entry with the same signature: succeed without change
 * - entry with a different signature: ErrorCode::LicenseAlreadyRegistered
 * - deactivated entry: ErrorCode::LicensePermanentlyDeactivated
 *
 * release() sets the terminal deactivated flag; entries are never deleted
 * except by revert() of an activation that failed to commit.
 */
class RegistryInterface {
  public:
    virtual ~RegistryInterface() = default;

    virtual Result<RegistrationOutcome> register_license(const std::string& license_id,
                                                         const std::string& device_signature,
                                                         Timestamp activated_at) = 0;

    /// Mark the entry deactivated (an entry is created if missing)
    virtual Result<void> release(const std::string& license_id, Timestamp when) = 0;

    virtual Result<std::optional<RegistryEntry>> lookup(const std::string& license_id) = 0;

    /// Undo a Created registration; deactivated entries are never removed
    virtual Result<void> revert(const std::string& license_id) = 0;

    /**
     * @brief Count a committed re-activation of a live entry
     *
     * Called only after the activation record was stored, so a failed
     * activation never changes the entry.
     * ErrorCode::NotActivated if there is no live entry for license_id.
     */
    virtual Result<void> record_activation(const std::string& license_id) = 0;
};

namespace detail {

using RegistryEntries = std::map<std::string, RegistryEntry>;

/// Registration rules shared by all registry implementations
Result<RegistrationOutcome> apply_registration(RegistryEntries& entries,
                                               const std::string& license_id,
                                               const std::string& device_signature,
                                               Timestamp activated_at);

void apply_release(RegistryEntries& entries, const std::string& license_id, Timestamp when);

/// True if an entry was removed
bool apply_revert(RegistryEntries& entries, const std::string& license_id);

/// False if there is no live entry to count
bool apply_record_activation(RegistryEntries& entries, const std::string& license_id);

}  // namespace detail

/**
 * @brief File-based registry
 *
 * One JSON document at <storage_path>/<prefix>_registry.json of the form
 * {"entries": {"<licenseId>": {...}}}, replaced atomically on every change.
 * A document that exists but cannot be parsed fails every operation with
 * ErrorCode::Tampered.
 */
class FileRegistry : public RegistryInterface {
  public:
    explicit FileRegistry(const std::string& storage_path, const std::string& prefix = "licenseguard");

    Result<RegistrationOutcome> register_license(const std::string& license_id,
                                                 const std::string& device_signature,
                                                 Timestamp activated_at) override;
    Result<void> release(const std::string& license_id, Timestamp when) override;
    Result<std::optional<RegistryEntry>> lookup(const std::string& license_id) override;
    Result<void> revert(const std::string& license_id) override;
    Result<void> record_activation(const std::string& license_id) override;

    [[nodiscard]] std::filesystem::path registry_path() const;

  private:
    Result<detail::RegistryEntries> load() const;
    Result<void> save(const detail::RegistryEntries& entries) const;

    std::filesystem::path storage_path_;
    std::string prefix_;
    mutable std::mutex mutex_;
};

/**
 * @brief In-memory registry (for testing or no persistence)
 */
class MemoryRegistry : public RegistryInterface {
  public:
    Result<RegistrationOutcome> register_license(const std::string& license_id,
                                                 const std::string& device_signature,
                                                 Timestamp activated_at) override;
    Result<void> release(const std::string& license_id, Timestamp when) override;
    Result<std::optional<RegistryEntry>> lookup(const std::string& license_id) override;
    Result<void> revert(const std::string& license_id) override;
    Result<void> record_activation(const std::string& license_id) override;

  private:
    detail::RegistryEntries entries_;
    mutable std::mutex mutex_;
};

}  // namespace licenseguard
