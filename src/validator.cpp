#include "licenseguard/validator.hpp"
#include "licenseguard/fingerprint.hpp"

#include <cmath>

namespace licenseguard {

namespace {

constexpr double kMillisPerDay = 86400000.0;

LicenseValidationResult failure(LicenseStatus status, ErrorCode code, std::string message,
                                const ActivatedLicenseData* stored = nullptr) {
    LicenseValidationResult result;
    result.status = status;
    result.error_code = code;
    result.error = message.empty() ? error_code_description(code) : std::move(message);
    if (stored != nullptr) {
        result.expires_at = stored->expires_at;
    }
    return result;
}

}  // namespace

Validator::Validator(KeyCodec codec, int warning_days)
    : codec_(std::move(codec)), warning_days_(warning_days) {}

int Validator::remaining_days(Timestamp expires_at, Timestamp now) noexcept {
    if (now >= expires_at) {
        return 0;
    }
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(expires_at - now).count();
    return static_cast<int>(std::ceil(static_cast<double>(millis) / kMillisPerDay));
}

LicenseValidationResult Validator::validate(const std::optional<ActivatedLicenseData>& stored,
                                            const DeviceFingerprint& current, Timestamp now,
                                            const RegistryLookup& lookup) const {
    if (!stored) {
        return failure(LicenseStatus::NotActivated, ErrorCode::NotActivated, "");
    }

    const ActivatedLicenseData& license = *stored;

    if (!codec_.verify(license)) {
        return failure(LicenseStatus::Tampered, ErrorCode::Tampered,
                       "License signature verification failed", &license);
    }
    if (license.signature != license.original_signature) {
        return failure(LicenseStatus::Tampered, ErrorCode::Tampered,
                       "License signature does not match the activated key", &license);
    }
    if (!codec_.verify_seal(license)) {
        return failure(LicenseStatus::Tampered, ErrorCode::Tampered,
                       "Activation record has been modified", &license);
    }

    std::optional<RegistryEntry> entry;
    if (lookup) {
        entry = lookup(license.license_id);
    }
    if (!entry) {
        return failure(LicenseStatus::Tampered, ErrorCode::Tampered,
                       "License is not registered on this installation", &license);
    }
    if (entry->deactivated) {
        return failure(LicenseStatus::Deactivated, ErrorCode::LicensePermanentlyDeactivated, "",
                       &license);
    }
    if (entry->device_signature != license.device_fingerprint.device_signature) {
        return failure(LicenseStatus::Tampered, ErrorCode::Tampered,
                       "License registration belongs to a different activation", &license);
    }

    if (!FingerprintEngine::compare(license.device_fingerprint, current)) {
        return failure(LicenseStatus::DeviceMismatch, ErrorCode::DeviceMismatch, "", &license);
    }

    if (now >= license.expires_at) {
        return failure(LicenseStatus::Expired, ErrorCode::Expired, "", &license);
    }

    LicenseValidationResult result;
    result.status = LicenseStatus::Valid;
    result.remaining_days = remaining_days(license.expires_at, now);
    result.is_expiring_soon = result.remaining_days <= warning_days_;
    result.expires_at = license.expires_at;
    return result;
}

}  // namespace licenseguard
