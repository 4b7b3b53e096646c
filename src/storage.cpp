#include "licenseguard/storage.hpp"
#include "licenseguard/json.hpp"

#include "file_io.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace licenseguard {

using LicenseResult = Result<std::optional<ActivatedLicenseData>>;

// ==================== FileStorage Implementation ====================

FileStorage::FileStorage(const std::string& storage_path, const std::string& prefix)
    : storage_path_(storage_path), prefix_(prefix) {}

std::filesystem::path FileStorage::license_path() const {
    return storage_path_ / (prefix_ + "_license.json");
}

Result<void> FileStorage::store_license(const ActivatedLicenseData& license) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto dir = detail::ensure_directory(storage_path_);
    if (dir.is_error()) {
        return dir;
    }

    std::string content;
    try {
        content = json::activated_license_to_json(license).dump(2);
    } catch (const nlohmann::json::exception& e) {
        return Result<void>::error(ErrorCode::StorageError,
                                   std::string("Cannot serialize license: ") + e.what());
    }

    return detail::write_file_atomic(license_path(), content);
}

LicenseResult FileStorage::get_license() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto content = detail::read_file(license_path());
    if (content.is_error()) {
        return LicenseResult::error(content.error_code(), content.error_message());
    }
    if (!content.value()) {
        return LicenseResult::ok(std::nullopt);
    }

    try {
        auto j = nlohmann::json::parse(*content.value());
        return LicenseResult::ok(json::parse_activated_license(j));
    } catch (const nlohmann::json::exception& e) {
        detail::logger()->warn("activation record is unreadable: {}", e.what());
    } catch (const std::invalid_argument& e) {
        detail::logger()->warn("activation record is malformed: {}", e.what());
    }
    return LicenseResult::error(ErrorCode::Tampered, "Activation record is corrupt");
}

Result<void> FileStorage::delete_license() {
    std::lock_guard<std::mutex> lock(mutex_);
    return detail::remove_file(license_path());
}

bool FileStorage::has_license() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    return std::filesystem::exists(license_path(), ec);
}

Result<void> FileStorage::touch_last_checked(Timestamp when) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto content = detail::read_file(license_path());
    if (content.is_error()) {
        return Result<void>::error(content.error_code(), content.error_message());
    }
    if (!content.value()) {
        return Result<void>::error(ErrorCode::NotActivated);
    }

    // Edit the document in place so fields written by newer versions survive
    auto j = nlohmann::json::parse(*content.value(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Result<void>::error(ErrorCode::Tampered, "Activation record is corrupt");
    }
    j["lastChecked"] = json::to_epoch_millis(when);

    return detail::write_file_atomic(license_path(), j.dump(2));
}

// ==================== MemoryStorage Implementation ====================

Result<void> MemoryStorage::store_license(const ActivatedLicenseData& license) {
    std::lock_guard<std::mutex> lock(mutex_);
    license_ = license;
    return Result<void>::ok();
}

LicenseResult MemoryStorage::get_license() {
    std::lock_guard<std::mutex> lock(mutex_);
    return LicenseResult::ok(license_);
}

Result<void> MemoryStorage::delete_license() {
    std::lock_guard<std::mutex> lock(mutex_);
    license_.reset();
    return Result<void>::ok();
}

bool MemoryStorage::has_license() {
    std::lock_guard<std::mutex> lock(mutex_);
    return license_.has_value();
}

Result<void> MemoryStorage::touch_last_checked(Timestamp when) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!license_) {
        return Result<void>::error(ErrorCode::NotActivated);
    }
    license_->last_checked = when;
    return Result<void>::ok();
}

}  // namespace licenseguard
