#include "licenseguard/guard.hpp"

#include "licenseguard/json.hpp"

#include "logging.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace licenseguard {

namespace {

constexpr auto kDay = std::chrono::hours(24);

LicenseValidationResult status_result(LicenseStatus status, ErrorCode code,
                                      const std::string& message) {
    LicenseValidationResult result;
    result.status = status;
    result.error_code = code;
    result.error = message.empty() ? error_code_description(code) : message;
    return result;
}

/// Storage and registry errors seen by a check: corruption is tampering, anything else is I/O
LicenseValidationResult check_error(ErrorCode code, const std::string& message) {
    if (code == ErrorCode::Tampered) {
        return status_result(LicenseStatus::Tampered, ErrorCode::Tampered, message);
    }
    return status_result(LicenseStatus::NotActivated, ErrorCode::StorageError, message);
}

GuardDecision blocked(const std::string& message) {
    GuardDecision decision;
    decision.result = status_result(LicenseStatus::Invalid, ErrorCode::Unknown, message);
    decision.can_proceed = false;
    return decision;
}

}  // namespace

Guard::Guard(std::shared_ptr<StorageInterface> storage, std::shared_ptr<RegistryInterface> registry,
             std::shared_ptr<FingerprintEngine> fingerprints, KeyCodec codec, GuardOptions options,
             Clock clock)
    : storage_(std::move(storage)),
      registry_(std::move(registry)),
      fingerprints_(std::move(fingerprints)),
      codec_(codec),
      validator_(std::move(codec), options.warning_days),
      options_(options),
      clock_(std::move(clock)) {
    if (!storage_ || !registry_ || !fingerprints_) {
        throw std::invalid_argument("Guard requires storage, registry and fingerprint engine");
    }
    if (!clock_) {
        clock_ = []() { return std::chrono::system_clock::now(); };
    }
    if (!codec_.has_signing_key()) {
        detail::logger()->warn("no signing key configured; every license will fail verification");
    }
}

Guard::~Guard() {
    stop_periodic_checks();
    if (worker_.joinable()) {
        // Destroyed from a handler on its own worker thread, which guard.hpp forbids
        detail::logger()->error("guard destroyed from its periodic-check thread");
        worker_.detach();
    }
}

// ==================== Checks ====================

GuardDecision Guard::verify_license() {
    GuardDecision decision;
    try {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        decision = check_locked();
    } catch (const std::exception& e) {
        detail::logger()->error("license check failed: {}", e.what());
        decision = blocked(std::string("License check failed: ") + e.what());
    } catch (...) {
        detail::logger()->error("license check failed with a non-standard exception");
        decision = blocked("License check failed");
    }

    publish(decision);
    return decision;
}

GuardDecision Guard::check_locked() {
    GuardDecision decision;

    auto stored = storage_->get_license();
    if (stored.is_error()) {
        detail::logger()->warn("cannot read activation record: {}", stored.error_message());
        decision.result = check_error(stored.error_code(), stored.error_message());
        return decision;
    }

    // Fetch the registry entry up front so validation stays free of I/O
    std::optional<RegistryEntry> entry;
    if (stored.value()) {
        auto lookup = registry_->lookup(stored.value()->license_id);
        if (lookup.is_error()) {
            detail::logger()->warn("cannot read license registry: {}", lookup.error_message());
            decision.result = check_error(lookup.error_code(), lookup.error_message());
            return decision;
        }
        entry = lookup.value();
    }

    DeviceFingerprint current = fingerprints_->generate();
    Timestamp now = clock_();

    decision.result = validator_.validate(
        stored.value(), current, now, [&entry](const std::string& license_id) {
            if (entry && entry->license_id == license_id) {
                return entry;
            }
            return std::optional<RegistryEntry>();
        });
    decision.can_proceed = decision.result.is_valid();

    if (decision.can_proceed) {
        auto touched = storage_->touch_last_checked(now);
        if (touched.is_error()) {
            detail::logger()->warn("cannot update lastChecked: {}", touched.error_message());
        }
    }

    return decision;
}

void Guard::publish(const GuardDecision& decision) {
    std::optional<LicenseStatus> previous;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        previous = last_status_;
        last_status_ = decision.result.status;
    }

    const auto& result = decision.result;
    event_bus_.emit(decision.can_proceed ? events::VALIDATION_SUCCESS : events::VALIDATION_FAILED,
                    result);

    if (!previous || *previous != result.status) {
        detail::logger()->info("license status: {} -> {}",
                               previous ? license_status_to_string(*previous) : "unknown",
                               license_status_to_string(result.status));
        event_bus_.emit(events::STATUS_CHANGED, result);
    }

    if (!decision.can_proceed) {
        event_bus_.emit(events::LICENSE_BLOCKED, result);
    }
}

std::optional<LicenseStatus> Guard::last_status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return last_status_;
}

// ==================== Activation ====================

Result<ActivatedLicenseData> Guard::activate(const std::string& license_key) {
    Result<ActivatedLicenseData> result =
        Result<ActivatedLicenseData>::error(ErrorCode::Unknown, "Activation failed");
    try {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        result = activate_locked(license_key);
    } catch (const std::exception& e) {
        detail::logger()->error("activation failed: {}", e.what());
        result = Result<ActivatedLicenseData>::error(ErrorCode::Unknown,
                                                     std::string("Activation failed: ") + e.what());
    } catch (...) {
        detail::logger()->error("activation failed with a non-standard exception");
        result = Result<ActivatedLicenseData>::error(ErrorCode::Unknown, "Activation failed");
    }

    if (result.is_ok()) {
        detail::logger()->info("license {} activated until {}", result.value().license_id,
                               json::format_timestamp(result.value().expires_at));
        event_bus_.emit(events::ACTIVATION_SUCCESS, result.value());
    } else {
        detail::logger()->warn("activation rejected: {} ({})",
                               error_code_to_string(result.error_code()), result.error_message());
        event_bus_.emit(events::ACTIVATION_ERROR, result.error_code());
    }
    return result;
}

Result<ActivatedLicenseData> Guard::activate_locked(const std::string& license_key) {
    using ActivationResult = Result<ActivatedLicenseData>;

    auto decoded = codec_.decode(license_key);
    if (decoded.is_error()) {
        return ActivationResult::error(decoded.error_code(), decoded.error_message());
    }
    const RawLicenseData& raw = decoded.value();

    if (!codec_.verify(raw)) {
        return ActivationResult::error(ErrorCode::SignatureInvalid);
    }

    DeviceFingerprint fingerprint = fingerprints_->generate();
    if (fingerprint.machine_id.empty()) {
        detail::logger()->warn("machine id unavailable; binding to secondary identifiers only");
    }
    // Persisted timestamps carry millisecond precision
    Timestamp now = json::from_epoch_millis(json::to_epoch_millis(clock_()));

    // A corrupt record is replaced by this activation, an unreadable one is not
    std::optional<ActivatedLicenseData> previous;
    auto stored = storage_->get_license();
    if (stored.is_ok()) {
        previous = stored.value();
    } else if (stored.error_code() != ErrorCode::Tampered) {
        return ActivationResult::error(ErrorCode::StorageError, stored.error_message());
    }

    auto lookup = registry_->lookup(raw.license_id);
    if (lookup.is_error()) {
        return ActivationResult::error(lookup.error_code(), lookup.error_message());
    }
    const std::optional<RegistryEntry>& entry = lookup.value();

    if (previous && previous->license_id == raw.license_id) {
        auto status = validator_.validate(previous, fingerprint, now,
                                          [&entry](const std::string&) { return entry; });
        if (status.is_valid()) {
            return ActivationResult::error(ErrorCode::LicenseAlreadyActivatedOnThisDevice);
        }
    }

    ActivatedLicenseData license;
    static_cast<RawLicenseData&>(license) = raw;
    license.activated_at = now;

    // Re-activation on the bound device keeps the original activation window.
    // An entry dated after now cannot move the window forward.
    if (entry && !entry->deactivated && entry->device_signature == fingerprint.device_signature) {
        license.activated_at = std::min(entry->activated_at, now);
    }

    license.expires_at = license.activated_at + kDay * license.max_days;
    if (now >= license.expires_at) {
        return ActivationResult::error(ErrorCode::Expired);
    }

    auto registration =
        registry_->register_license(raw.license_id, fingerprint.device_signature, now);
    if (registration.is_error()) {
        return ActivationResult::error(registration.error_code(), registration.error_message());
    }
    bool created = registration.value() == RegistrationOutcome::Created;

    auto roll_back = [&]() {
        if (!created) {
            return;
        }
        auto reverted = registry_->revert(raw.license_id);
        if (reverted.is_error()) {
            detail::logger()->error("cannot revert registration of {}: {}", raw.license_id,
                                    reverted.error_message());
        }
    };

    license.device_fingerprint = fingerprint;
    license.original_signature = raw.signature;
    license.last_checked = now;

    license.activation_seal = codec_.seal(license);
    if (license.activation_seal.empty()) {
        roll_back();
        return ActivationResult::error(ErrorCode::Unknown, "Cannot seal activation record");
    }

    auto saved = storage_->store_license(license);
    if (saved.is_error()) {
        roll_back();
        return ActivationResult::error(ErrorCode::StorageError, saved.error_message());
    }

    if (!created) {
        auto counted = registry_->record_activation(raw.license_id);
        if (counted.is_error()) {
            detail::logger()->warn("cannot count re-activation of {}: {}", raw.license_id,
                                   counted.error_message());
        }
    }

    if (previous && previous->license_id != raw.license_id) {
        auto released = registry_->release(previous->license_id, now);
        if (released.is_error()) {
            detail::logger()->warn("cannot release replaced license {}: {}",
                                   previous->license_id, released.error_message());
        } else {
            detail::logger()->info("replaced license {} released", previous->license_id);
        }
    }

    return ActivationResult::ok(std::move(license));
}

// ==================== Deactivation ====================

Result<void> Guard::deactivate() {
    Result<void> result = Result<void>::error(ErrorCode::Unknown, "Deactivation failed");
    std::string released_id;
    try {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        result = deactivate_locked(released_id);
    } catch (const std::exception& e) {
        detail::logger()->error("deactivation failed: {}", e.what());
        result = Result<void>::error(ErrorCode::Unknown,
                                     std::string("Deactivation failed: ") + e.what());
    } catch (...) {
        detail::logger()->error("deactivation failed with a non-standard exception");
        result = Result<void>::error(ErrorCode::Unknown, "Deactivation failed");
    }

    if (result.is_ok()) {
        detail::logger()->info("license {} deactivated", released_id);
        event_bus_.emit(events::DEACTIVATION_SUCCESS, released_id);
    } else {
        detail::logger()->warn("deactivation failed: {} ({})",
                               error_code_to_string(result.error_code()), result.error_message());
        event_bus_.emit(events::DEACTIVATION_ERROR, result.error_code());
    }
    return result;
}

Result<void> Guard::deactivate_locked(std::string& released_id) {
    auto stored = storage_->get_license();
    if (stored.is_error()) {
        return Result<void>::error(stored.error_code(), stored.error_message());
    }
    if (!stored.value()) {
        return Result<void>::error(ErrorCode::NotActivated);
    }

    const std::string license_id = stored.value()->license_id;

    // Release first: a crash after this point leaves the key blocked, never reusable
    auto released = registry_->release(license_id, clock_());
    if (released.is_error()) {
        return released;
    }
    released_id = license_id;

    auto deleted = storage_->delete_license();
    if (deleted.is_error()) {
        return Result<void>::error(ErrorCode::StorageError,
                                   "License was released but the local record could not be "
                                   "removed: " +
                                       deleted.error_message());
    }
    return Result<void>::ok();
}

// ==================== Accessors ====================

DeviceFingerprint Guard::current_fingerprint() const { return fingerprints_->generate(); }

Result<std::optional<ActivatedLicenseData>> Guard::stored_license() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return storage_->get_license();
}

bool Guard::has_stored_license() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return storage_->has_license();
}

Subscription Guard::on(const std::string& event, EventHandler handler) {
    return event_bus_.on(event, std::move(handler));
}

// ==================== Periodic Checks ====================

void Guard::start_periodic_checks() {
    if (std::this_thread::get_id() == worker_id_.load()) {
        detail::logger()->debug("periodic checks cannot be restarted from their own thread");
        return;
    }

    bool stopped = false;
    {
        std::lock_guard<std::mutex> control(control_mutex_);
        stopped = halt_worker();

        if (options_.check_interval_seconds > 0) {
            checking_ = true;
            worker_ = std::thread([this]() {
                while (checking_) {
                    {
                        std::unique_lock<std::mutex> lock(wait_mutex_);
                        wait_cv_.wait_for(
                            lock, std::chrono::duration<double>(options_.check_interval_seconds),
                            [this]() { return !checking_; });
                    }

                    if (!checking_) {
                        break;
                    }

                    auto decision = this->verify_license();
                    if (!checking_) {
                        break;
                    }
                    event_bus_.emit(events::GUARD_CYCLE, decision.result);
                }
            });
            worker_id_ = worker_.get_id();
            detail::logger()->debug("periodic checks every {}s", options_.check_interval_seconds);
        }
    }

    if (stopped) {
        event_bus_.emit(events::GUARD_STOPPED);
    }
}

void Guard::stop_periodic_checks() {
    // From a handler on the worker thread: the loop exits on its own
    if (std::this_thread::get_id() == worker_id_.load()) {
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            checking_ = false;
        }
        wait_cv_.notify_all();
        return;
    }

    bool stopped = false;
    {
        std::lock_guard<std::mutex> control(control_mutex_);
        stopped = halt_worker();
    }

    if (stopped) {
        event_bus_.emit(events::GUARD_STOPPED);
    }
}

bool Guard::halt_worker() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        checking_ = false;
    }
    wait_cv_.notify_all();

    if (!worker_.joinable()) {
        return false;
    }
    worker_.join();
    worker_id_ = std::thread::id();
    return true;
}

}  // namespace licenseguard
