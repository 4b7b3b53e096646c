#pragma once

/**
 * @file storage.hpp
 * @brief Persistence of the single activation record
 */

#include "licenseguard.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace licenseguard {

/**
 * @brief Storage interface for the activation record
 *
 * An installation holds at most one record. get_license() distinguishes a
 * clean "nothing stored" (ok(nullopt)) from a record that exists but cannot
 * be parsed (ErrorCode::Tampered).
 */
class StorageInterface {
  public:
    virtual ~StorageInterface() = default;

    /// Replace the stored record
    virtual Result<void> store_license(const ActivatedLicenseData& license) = 0;

    /// Retrieve the stored record
    virtual Result<std::optional<ActivatedLicenseData>> get_license() = 0;

    /// Erase the stored record; erasing nothing succeeds
    virtual Result<void> delete_license() = 0;

    /// True if any record (parseable or not) is present
    virtual bool has_license() = 0;

    /// Update the lastChecked timestamp of the stored record
    virtual Result<void> touch_last_checked(Timestamp when) = 0;
};

/**
 * @brief File-based storage implementation
 *
 * Stores the record as JSON in <storage_path>/<prefix>_license.json and
 * replaces it atomically on every write.
 */
class FileStorage : public StorageInterface {
  public:
    /**
     * @brief Construct file storage
     *
     * @param storage_path Directory path for storage (created on first write)
     * @param prefix Optional prefix for file names
     */
    explicit FileStorage(const std::string& storage_path, const std::string& prefix = "licenseguard");

    Result<void> store_license(const ActivatedLicenseData& license) override;
    Result<std::optional<ActivatedLicenseData>> get_license() override;
    Result<void> delete_license() override;
    bool has_license() override;
    Result<void> touch_last_checked(Timestamp when) override;

    [[nodiscard]] std::filesystem::path license_path() const;

  private:
    std::filesystem::path storage_path_;
    std::string prefix_;
    mutable std::mutex mutex_;
};

/**
 * @brief In-memory storage implementation (for testing or no persistence)
 */
class MemoryStorage : public StorageInterface {
  public:
    Result<void> store_license(const ActivatedLicenseData& license) override;
    Result<std::optional<ActivatedLicenseData>> get_license() override;
    Result<void> delete_license() override;
    bool has_license() override;
    Result<void> touch_last_checked(Timestamp when) override;

  private:
    std::optional<ActivatedLicenseData> license_;
    mutable std::mutex mutex_;
};

}  // namespace licenseguard
