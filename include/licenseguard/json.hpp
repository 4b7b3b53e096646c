#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization for LicenseGuard records
 *
 * Uses nlohmann/json for license keys, the activation record and the registry.
 * Signed payloads use nlohmann::ordered_json so the field order is fixed.
 */

#include "licenseguard.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace licenseguard {
namespace json {

using nlohmann::json;
using nlohmann::ordered_json;

// ==================== Timestamp Helpers ====================

namespace detail {

inline std::time_t utc_to_time_t(std::tm* tm) {
#if defined(_MSC_VER)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

}  // namespace detail

/// Parse ISO 8601 timestamp ("2026-01-19T12:00:00.123Z", "+02:00" offsets accepted)
[[nodiscard]] inline std::optional<Timestamp> parse_timestamp(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    std::tm tm = {};
    std::istringstream ss(str);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        return std::nullopt;
    }

    int64_t millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        int digits = 0;
        while (ss.peek() != EOF && std::isdigit(ss.peek())) {
            int d = ss.get() - '0';
            if (digits < 3) {
                millis = millis * 10 + d;
            }
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    int64_t offset_seconds = 0;
    int next = ss.peek();
    if (next == 'Z' || next == 'z') {
        ss.get();
    } else if (next == '+' || next == '-') {
        ss.get();
        std::string digits;
        while (digits.size() < 4 && ss.peek() != EOF) {
            char c = static_cast<char>(ss.get());
            if (c == ':') {
                continue;
            }
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            digits += c;
        }
        if (digits.size() != 4) {
            return std::nullopt;
        }
        int hours = std::stoi(digits.substr(0, 2));
        int minutes = std::stoi(digits.substr(2, 2));
        offset_seconds = (hours * 3600 + minutes * 60) * (next == '-' ? -1 : 1);
    }

    std::time_t time = detail::utc_to_time_t(&tm);
    if (time == -1) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(time) - std::chrono::seconds(offset_seconds) +
           std::chrono::milliseconds(millis);
}

/// Format Timestamp to ISO 8601 string with millisecond precision
[[nodiscard]] inline std::string format_timestamp(const Timestamp& ts) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(ts);
    if (secs > ts) {
        secs -= std::chrono::seconds(1);
    }
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ts - secs).count();
    auto time = std::chrono::system_clock::to_time_t(secs);
    std::tm tm = {};
#if defined(_MSC_VER)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << millis << 'Z';
    return ss.str();
}

/// Timestamp as Unix epoch milliseconds
[[nodiscard]] inline int64_t to_epoch_millis(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/// Latest instant a Timestamp can hold, in epoch milliseconds
constexpr int64_t kMaxEpochMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(Timestamp::duration::max()).count();

/// Longest license term accepted from a key or a stored record
constexpr int kMaxLicenseDays = 36500;

/// Unix epoch milliseconds to Timestamp; millis must lie in [0, kMaxEpochMillis]
[[nodiscard]] inline Timestamp from_epoch_millis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

// ==================== Metadata Helpers ====================

/// Parse JSON object to Metadata map; non-string values are stringified
[[nodiscard]] inline Metadata parse_metadata(const json& j) {
    Metadata result;
    if (j.is_object()) {
        for (auto& [key, value] : j.items()) {
            if (value.is_string()) {
                result[key] = value.get<std::string>();
            } else if (value.is_boolean()) {
                result[key] = value.get<bool>() ? "true" : "false";
            } else if (value.is_null()) {
                result[key] = "";
            } else {
                result[key] = value.dump();
            }
        }
    }
    return result;
}

[[nodiscard]] inline json metadata_to_json(const Metadata& meta) {
    json j = json::object();
    for (const auto& [key, value] : meta) {
        j[key] = value;
    }
    return j;
}

// ==================== Field Helpers ====================

namespace detail {

inline std::string require_string(const json& j, const char* field) {
    if (!j.contains(field) || !j[field].is_string()) {
        throw std::invalid_argument(std::string("missing or invalid field: ") + field);
    }
    return j[field].get<std::string>();
}

inline int64_t require_int(const json& j, const char* field) {
    if (!j.contains(field) || !j[field].is_number_integer()) {
        throw std::invalid_argument(std::string("missing or invalid field: ") + field);
    }
    return j[field].get<int64_t>();
}

/// Epoch milliseconds from a stored record, rejected if a Timestamp cannot hold them
inline int64_t checked_epoch_millis(const json& value, const char* field) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("missing or invalid field: ") + field);
    }
    if (value.is_number_unsigned() &&
        value.get<uint64_t>() > static_cast<uint64_t>(kMaxEpochMillis)) {
        throw std::invalid_argument(std::string("timestamp out of range: ") + field);
    }
    int64_t millis = value.get<int64_t>();
    if (millis < 0 || millis > kMaxEpochMillis) {
        throw std::invalid_argument(std::string("timestamp out of range: ") + field);
    }
    return millis;
}

inline Timestamp require_timestamp(const json& j, const char* field) {
    if (!j.contains(field)) {
        throw std::invalid_argument(std::string("missing or invalid field: ") + field);
    }
    return from_epoch_millis(checked_epoch_millis(j[field], field));
}

inline std::string optional_string(const json& j, const char* field) {
    if (j.contains(field) && j[field].is_string()) {
        return j[field].get<std::string>();
    }
    return "";
}

inline std::vector<std::string> parse_string_array(const json& j) {
    std::vector<std::string> result;
    if (j.is_array()) {
        for (const auto& item : j) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

}  // namespace detail

// ==================== Raw License (key payload) ====================

/**
 * @brief Parse the JSON object of a license key
 *
 * licenseId, maxDays (positive integer), createdAt (ISO-8601) and signature
 * are required; licenseType defaults to "standard".
 */
[[nodiscard]] inline Result<RawLicenseData> parse_raw_license(const json& j) {
    if (!j.is_object()) {
        return Result<RawLicenseData>::error(ErrorCode::InvalidKey, "License key is not a JSON object");
    }

    RawLicenseData data;

    if (!j.contains("licenseId") || !j["licenseId"].is_string() ||
        j["licenseId"].get<std::string>().empty()) {
        return Result<RawLicenseData>::error(ErrorCode::InvalidKey, "License key has no licenseId");
    }
    data.license_id = j["licenseId"].get<std::string>();

    if (!j.contains("maxDays") || !j["maxDays"].is_number()) {
        return Result<RawLicenseData>::error(ErrorCode::InvalidKey, "License key has no maxDays");
    }
    double max_days = j["maxDays"].get<double>();
    if (std::floor(max_days) != max_days) {
        return Result<RawLicenseData>::error(ErrorCode::InvalidKey,
                                             "maxDays must be a whole number of days");
    }
    if (max_days <= 0 || max_days > kMaxLicenseDays) {
        return Result<RawLicenseData>::error(ErrorCode::InvalidKey, "maxDays is out of range");
    }
    data.max_days = static_cast<int>(max_days);

    if (!j.contains("createdAt") || !j["createdAt"].is_string() ||
        !parse_timestamp(j["createdAt"].get<std::string>())) {
        return Result<RawLicenseData>::error(ErrorCode::InvalidKey,
                                             "License key has no valid createdAt");
    }
    data.created_at = j["createdAt"].get<std::string>();

    if (!j.contains("signature") || !j["signature"].is_string() ||
        j["signature"].get<std::string>().empty()) {
        return Result<RawLicenseData>::error(ErrorCode::InvalidKey, "License key has no signature");
    }
    data.signature = j["signature"].get<std::string>();

    if (j.contains("licenseType") && !j["licenseType"].is_null()) {
        auto type = j["licenseType"].is_string()
                        ? license_type_from_string(j["licenseType"].get<std::string>())
                        : std::nullopt;
        if (!type) {
            return Result<RawLicenseData>::error(ErrorCode::InvalidKey, "Unknown licenseType");
        }
        data.license_type = *type;
    }

    if (j.contains("features")) {
        data.features = detail::parse_string_array(j["features"]);
    }

    if (j.contains("metadata")) {
        data.metadata = parse_metadata(j["metadata"]);
    }

    return Result<RawLicenseData>::ok(std::move(data));
}

/// Serialize a raw license to the key JSON layout
[[nodiscard]] inline ordered_json raw_license_to_json(const RawLicenseData& data) {
    ordered_json j;
    j["licenseId"] = data.license_id;
    j["licenseType"] = license_type_to_string(data.license_type);
    j["maxDays"] = data.max_days;
    j["createdAt"] = data.created_at;
    j["signature"] = data.signature;
    j["features"] = data.features;
    ordered_json meta = ordered_json::object();
    for (const auto& [key, value] : data.metadata) {
        meta[key] = value;
    }
    j["metadata"] = meta;
    return j;
}

/**
 * @brief Canonical signed payload of a license key
 *
 * Exactly {"licenseId","licenseType","maxDays","createdAt"} in that order,
 * compact, so extra or reordered fields in the key never change it.
 */
[[nodiscard]] inline std::string canonical_key_payload(const RawLicenseData& data) {
    ordered_json j;
    j["licenseId"] = data.license_id;
    j["licenseType"] = license_type_to_string(data.license_type);
    j["maxDays"] = data.max_days;
    j["createdAt"] = data.created_at;
    return j.dump();
}

// ==================== Device Fingerprint ====================

[[nodiscard]] inline json fingerprint_to_json(const DeviceFingerprint& fp) {
    json j;
    j["machineId"] = fp.machine_id;
    j["platform"] = fp.platform;
    j["arch"] = fp.arch;
    j["hostname"] = fp.hostname;
    j["macAddresses"] = fp.mac_addresses;
    j["macAddress"] = fp.primary_mac();
    j["cpuInfo"] = fp.cpu_info;
    j["memoryInfo"] = fp.memory_info;
    j["osRelease"] = fp.os_release;
    j["deviceSignature"] = fp.device_signature;
    return j;
}

/// Parse a fingerprint; throws std::invalid_argument when primary fields are missing
[[nodiscard]] inline DeviceFingerprint parse_fingerprint(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("deviceFingerprint is not an object");
    }

    DeviceFingerprint fp;
    fp.machine_id = detail::require_string(j, "machineId");
    fp.platform = detail::require_string(j, "platform");
    fp.arch = detail::require_string(j, "arch");
    fp.hostname = detail::optional_string(j, "hostname");
    if (j.contains("macAddresses")) {
        fp.mac_addresses = detail::parse_string_array(j["macAddresses"]);
    }
    if (fp.mac_addresses.empty()) {
        auto mac = detail::optional_string(j, "macAddress");
        if (!mac.empty()) {
            fp.mac_addresses.push_back(mac);
        }
    }
    fp.cpu_info = detail::optional_string(j, "cpuInfo");
    fp.memory_info = detail::optional_string(j, "memoryInfo");
    fp.os_release = detail::optional_string(j, "osRelease");
    fp.device_signature = detail::require_string(j, "deviceSignature");
    return fp;
}

// ==================== Activated License (record) ====================

[[nodiscard]] inline json activated_license_to_json(const ActivatedLicenseData& license) {
    json j;
    j["licenseId"] = license.license_id;
    j["licenseType"] = license_type_to_string(license.license_type);
    j["maxDays"] = license.max_days;
    j["createdAt"] = license.created_at;
    j["signature"] = license.signature;
    j["features"] = license.features;
    j["metadata"] = metadata_to_json(license.metadata);
    j["activatedAt"] = to_epoch_millis(license.activated_at);
    j["expiresAt"] = to_epoch_millis(license.expires_at);
    j["deviceFingerprint"] = fingerprint_to_json(license.device_fingerprint);
    j["originalSignature"] = license.original_signature;
    j["activationSeal"] = license.activation_seal;
    if (license.last_checked) {
        j["lastChecked"] = to_epoch_millis(*license.last_checked);
    } else {
        j["lastChecked"] = nullptr;
    }
    return j;
}

/**
 * @brief Parse a persisted activation record
 *
 * Throws std::invalid_argument or nlohmann::json::exception when the record
 * is structurally broken; callers treat that as tampering.
 */
[[nodiscard]] inline ActivatedLicenseData parse_activated_license(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("activation record is not an object");
    }

    ActivatedLicenseData license;
    license.license_id = detail::require_string(j, "licenseId");

    auto type = license_type_from_string(detail::require_string(j, "licenseType"));
    if (!type) {
        throw std::invalid_argument("unknown licenseType");
    }
    license.license_type = *type;

    int64_t max_days = detail::require_int(j, "maxDays");
    if (max_days <= 0 || max_days > kMaxLicenseDays) {
        throw std::invalid_argument("maxDays is out of range");
    }
    license.max_days = static_cast<int>(max_days);
    license.created_at = detail::require_string(j, "createdAt");
    license.signature = detail::require_string(j, "signature");
    if (j.contains("features")) {
        license.features = detail::parse_string_array(j["features"]);
    }
    if (j.contains("metadata")) {
        license.metadata = parse_metadata(j["metadata"]);
    }

    license.activated_at = detail::require_timestamp(j, "activatedAt");
    license.expires_at = detail::require_timestamp(j, "expiresAt");

    if (!j.contains("deviceFingerprint")) {
        throw std::invalid_argument("missing field: deviceFingerprint");
    }
    license.device_fingerprint = parse_fingerprint(j["deviceFingerprint"]);
    license.original_signature = detail::require_string(j, "originalSignature");
    license.activation_seal = detail::require_string(j, "activationSeal");

    if (j.contains("lastChecked") && j["lastChecked"].is_number_integer()) {
        license.last_checked = detail::require_timestamp(j, "lastChecked");
    }

    return license;
}

/**
 * @brief Canonical payload sealed into an activation record
 *
 * Covers the activation window and the full device snapshot, so editing
 * expiresAt or the fingerprint in the stored file breaks the seal.
 */
[[nodiscard]] inline std::string canonical_seal_payload(const ActivatedLicenseData& license) {
    const auto& fp = license.device_fingerprint;

    ordered_json device;
    device["machineId"] = fp.machine_id;
    device["platform"] = fp.platform;
    device["arch"] = fp.arch;
    device["hostname"] = fp.hostname;
    device["macAddresses"] = fp.mac_addresses;
    device["cpuInfo"] = fp.cpu_info;
    device["memoryInfo"] = fp.memory_info;
    device["osRelease"] = fp.os_release;
    device["deviceSignature"] = fp.device_signature;

    ordered_json j;
    j["licenseId"] = license.license_id;
    j["licenseType"] = license_type_to_string(license.license_type);
    j["maxDays"] = license.max_days;
    j["activatedAt"] = to_epoch_millis(license.activated_at);
    j["expiresAt"] = to_epoch_millis(license.expires_at);
    j["deviceFingerprint"] = device;
    return j.dump();
}

// ==================== Registry ====================

[[nodiscard]] inline json registry_entry_to_json(const RegistryEntry& entry) {
    json j;
    j["licenseId"] = entry.license_id;
    j["deviceSignature"] = entry.device_signature;
    j["activatedAt"] = to_epoch_millis(entry.activated_at);
    j["deactivated"] = entry.deactivated;
    if (entry.deactivated_at) {
        j["deactivatedAt"] = to_epoch_millis(*entry.deactivated_at);
    } else {
        j["deactivatedAt"] = nullptr;
    }
    j["activationCount"] = entry.activation_count;
    return j;
}

[[nodiscard]] inline RegistryEntry parse_registry_entry(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("registry entry is not an object");
    }

    RegistryEntry entry;
    entry.license_id = detail::require_string(j, "licenseId");
    entry.device_signature = detail::optional_string(j, "deviceSignature");
    if (j.contains("activatedAt")) {
        entry.activated_at = detail::require_timestamp(j, "activatedAt");
    }
    if (!j.contains("deactivated") || !j["deactivated"].is_boolean()) {
        throw std::invalid_argument("missing or invalid field: deactivated");
    }
    entry.deactivated = j["deactivated"].get<bool>();
    if (j.contains("deactivatedAt") && j["deactivatedAt"].is_number_integer()) {
        entry.deactivated_at = detail::require_timestamp(j, "deactivatedAt");
    }
    entry.activation_count = j.value("activationCount", 0);
    return entry;
}

}  // namespace json
}  // namespace licenseguard
