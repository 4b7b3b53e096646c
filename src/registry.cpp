#include "licenseguard/registry.hpp"
#include "licenseguard/json.hpp"

#include "file_io.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace licenseguard {

using LookupResult = Result<std::optional<RegistryEntry>>;
using RegisterResult = Result<RegistrationOutcome>;

// ==================== Shared Rules ====================

namespace detail {

RegisterResult apply_registration(RegistryEntries& entries, const std::string& license_id,
                                  const std::string& device_signature, Timestamp activated_at) {
    auto it = entries.find(license_id);
    if (it == entries.end()) {
        RegistryEntry entry;
        entry.license_id = license_id;
        entry.device_signature = device_signature;
        entry.activated_at = activated_at;
        entry.activation_count = 1;
        entries.emplace(license_id, std::move(entry));
        return RegisterResult::ok(RegistrationOutcome::Created);
    }

    RegistryEntry& entry = it->second;
    if (entry.deactivated) {
        return RegisterResult::error(ErrorCode::LicensePermanentlyDeactivated);
    }
    if (entry.device_signature != device_signature) {
        return RegisterResult::error(ErrorCode::LicenseAlreadyRegistered);
    }
    return RegisterResult::ok(RegistrationOutcome::AlreadyBound);
}

void apply_release(RegistryEntries& entries, const std::string& license_id, Timestamp when) {
    auto it = entries.find(license_id);
    if (it == entries.end()) {
        RegistryEntry entry;
        entry.license_id = license_id;
        entry.activated_at = when;
        it = entries.emplace(license_id, std::move(entry)).first;
    }
    if (!it->second.deactivated) {
        it->second.deactivated = true;
        it->second.deactivated_at = when;
    }
}

bool apply_revert(RegistryEntries& entries, const std::string& license_id) {
    auto it = entries.find(license_id);
    if (it == entries.end() || it->second.deactivated) {
        return false;
    }
    entries.erase(it);
    return true;
}

bool apply_record_activation(RegistryEntries& entries, const std::string& license_id) {
    auto it = entries.find(license_id);
    if (it == entries.end() || it->second.deactivated) {
        return false;
    }
    it->second.activation_count += 1;
    return true;
}

}  // namespace detail

// ==================== FileRegistry Implementation ====================

FileRegistry::FileRegistry(const std::string& storage_path, const std::string& prefix)
    : storage_path_(storage_path), prefix_(prefix) {}

std::filesystem::path FileRegistry::registry_path() const {
    return storage_path_ / (prefix_ + "_registry.json");
}

Result<detail::RegistryEntries> FileRegistry::load() const {
    using EntriesResult = Result<detail::RegistryEntries>;

    auto content = detail::read_file(registry_path());
    if (content.is_error()) {
        return EntriesResult::error(content.error_code(), content.error_message());
    }
    if (!content.value()) {
        return EntriesResult::ok({});
    }

    try {
        auto j = nlohmann::json::parse(*content.value());
        if (!j.is_object() || !j.contains("entries") || !j["entries"].is_object()) {
            throw std::invalid_argument("registry has no entries object");
        }

        detail::RegistryEntries entries;
        for (auto& [id, value] : j["entries"].items()) {
            RegistryEntry entry = json::parse_registry_entry(value);
            if (entry.license_id != id) {
                throw std::invalid_argument("registry entry key does not match its licenseId");
            }
            entries.emplace(id, std::move(entry));
        }
        return EntriesResult::ok(std::move(entries));
    } catch (const nlohmann::json::exception& e) {
        detail::logger()->error("registry is unreadable: {}", e.what());
    } catch (const std::invalid_argument& e) {
        detail::logger()->error("registry is malformed: {}", e.what());
    }
    return EntriesResult::error(ErrorCode::Tampered, "License registry is corrupt");
}

Result<void> FileRegistry::save(const detail::RegistryEntries& entries) const {
    auto dir = detail::ensure_directory(storage_path_);
    if (dir.is_error()) {
        return dir;
    }

    nlohmann::json doc;
    doc["entries"] = nlohmann::json::object();
    for (const auto& [id, entry] : entries) {
        doc["entries"][id] = json::registry_entry_to_json(entry);
    }

    std::string content;
    try {
        content = doc.dump(2);
    } catch (const nlohmann::json::exception& e) {
        return Result<void>::error(ErrorCode::StorageError,
                                   std::string("Cannot serialize registry: ") + e.what());
    }
    return detail::write_file_atomic(registry_path(), content);
}

RegisterResult FileRegistry::register_license(const std::string& license_id,
                                              const std::string& device_signature,
                                              Timestamp activated_at) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entries = load();
    if (entries.is_error()) {
        return RegisterResult::error(entries.error_code(), entries.error_message());
    }

    auto outcome =
        detail::apply_registration(entries.value(), license_id, device_signature, activated_at);
    if (outcome.is_error() || outcome.value() == RegistrationOutcome::AlreadyBound) {
        return outcome;
    }

    auto saved = save(entries.value());
    if (saved.is_error()) {
        return RegisterResult::error(saved.error_code(), saved.error_message());
    }
    return outcome;
}

Result<void> FileRegistry::release(const std::string& license_id, Timestamp when) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entries = load();
    if (entries.is_error()) {
        return Result<void>::error(entries.error_code(), entries.error_message());
    }

    detail::apply_release(entries.value(), license_id, when);
    return save(entries.value());
}

LookupResult FileRegistry::lookup(const std::string& license_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entries = load();
    if (entries.is_error()) {
        return LookupResult::error(entries.error_code(), entries.error_message());
    }

    auto it = entries.value().find(license_id);
    if (it == entries.value().end()) {
        return LookupResult::ok(std::nullopt);
    }
    return LookupResult::ok(it->second);
}

Result<void> FileRegistry::revert(const std::string& license_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entries = load();
    if (entries.is_error()) {
        return Result<void>::error(entries.error_code(), entries.error_message());
    }

    if (!detail::apply_revert(entries.value(), license_id)) {
        return Result<void>::ok();
    }
    return save(entries.value());
}

Result<void> FileRegistry::record_activation(const std::string& license_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto entries = load();
    if (entries.is_error()) {
        return Result<void>::error(entries.error_code(), entries.error_message());
    }

    if (!detail::apply_record_activation(entries.value(), license_id)) {
        return Result<void>::error(ErrorCode::NotActivated,
                                   "No live registry entry for " + license_id);
    }
    return save(entries.value());
}

// ==================== MemoryRegistry Implementation ====================

RegisterResult MemoryRegistry::register_license(const std::string& license_id,
                                                const std::string& device_signature,
                                                Timestamp activated_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    return detail::apply_registration(entries_, license_id, device_signature, activated_at);
}

Result<void> MemoryRegistry::release(const std::string& license_id, Timestamp when) {
    std::lock_guard<std::mutex> lock(mutex_);
    detail::apply_release(entries_, license_id, when);
    return Result<void>::ok();
}

LookupResult MemoryRegistry::lookup(const std::string& license_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(license_id);
    if (it == entries_.end()) {
        return LookupResult::ok(std::nullopt);
    }
    return LookupResult::ok(it->second);
}

Result<void> MemoryRegistry::revert(const std::string& license_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    detail::apply_revert(entries_, license_id);
    return Result<void>::ok();
}

Result<void> MemoryRegistry::record_activation(const std::string& license_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!detail::apply_record_activation(entries_, license_id)) {
        return Result<void>::error(ErrorCode::NotActivated,
                                   "No live registry entry for " + license_id);
    }
    return Result<void>::ok();
}

}  // namespace licenseguard
