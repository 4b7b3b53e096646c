#include "licenseguard/licenseguard.hpp"
#include "licenseguard/device.hpp"
#include "licenseguard/fingerprint.hpp"
#include "licenseguard/guard.hpp"
#include "licenseguard/registry.hpp"
#include "licenseguard/storage.hpp"

#include "logging.hpp"

#include <stdexcept>

namespace licenseguard {

namespace {

std::unique_ptr<Guard> make_guard(const Config& config) {
    std::shared_ptr<StorageInterface> storage;
    std::shared_ptr<RegistryInterface> registry;

    if (!config.storage_path.empty()) {
        storage = std::make_shared<FileStorage>(config.storage_path, config.storage_prefix);
        registry = std::make_shared<FileRegistry>(config.storage_path, config.storage_prefix);
    } else {
        detail::logger()->debug("no storage path configured; activation will not persist");
        storage = std::make_shared<MemoryStorage>();
        registry = std::make_shared<MemoryRegistry>();
    }

    auto fingerprints =
        std::make_shared<FingerprintEngine>(std::make_shared<SystemDeviceInfoProvider>());

    GuardOptions options;
    options.warning_days = config.warning_days;
    options.check_interval_seconds = config.check_interval_seconds;

    return std::make_unique<Guard>(std::move(storage), std::move(registry),
                                   std::move(fingerprints), KeyCodec(config.signing_key), options);
}

}  // namespace

// PIMPL implementation
class ActivationService::Impl {
  public:
    Impl(Config config, std::unique_ptr<Guard> guard)
        : config_(std::move(config)), guard_(std::move(guard)) {
        if (!guard_) {
            throw std::invalid_argument("ActivationService requires a guard");
        }
    }

    ~Impl() { guard_->stop_periodic_checks(); }

    LicenseValidationResult verify_license() { return guard_->verify_license().result; }

    bool can_proceed() { return guard_->verify_license().can_proceed; }

    ActivationOutcome activate(const std::string& license_key) {
        ActivationOutcome outcome;
        auto result = guard_->activate(license_key);
        if (result.is_ok()) {
            outcome.success = true;
            outcome.license = std::move(result).value();
        } else {
            outcome.error = result.error_message();
            outcome.error_code = result.error_code();
        }
        return outcome;
    }

    DeactivationOutcome deactivate() {
        DeactivationOutcome outcome;
        auto result = guard_->deactivate();
        if (result.is_ok()) {
            outcome.success = true;
        } else {
            outcome.error = result.error_message();
            outcome.error_code = result.error_code();
        }
        return outcome;
    }

    DeviceInfoSummary get_current_device_info() const {
        return FingerprintEngine::summarize(guard_->current_fingerprint());
    }

    std::optional<LicenseInfo> get_license_info() {
        auto stored = guard_->stored_license();
        if (stored.is_error() || !stored.value()) {
            return std::nullopt;
        }
        const ActivatedLicenseData& license = *stored.value();

        auto decision = guard_->verify_license();

        LicenseInfo info;
        info.license_id = license.license_id;
        info.license_type = license.license_type;
        info.activated_at = license.activated_at;
        info.expires_at = license.expires_at;
        info.remaining_days = Validator::remaining_days(license.expires_at, guard_->now());
        info.is_expiring_soon =
            info.remaining_days > 0 && info.remaining_days <= guard_->options().warning_days;
        info.features = license.features;
        info.status = decision.result.status;
        info.device_id = FingerprintEngine::summarize(license.device_fingerprint).machine_id;
        if (!decision.can_proceed) {
            info.error = decision.result.error;
        }
        return info;
    }

    bool is_first_run() const { return !guard_->has_stored_license(); }

    void start_auto_validation() { guard_->start_periodic_checks(); }

    void stop_auto_validation() { guard_->stop_periodic_checks(); }

    bool is_auto_validating() const { return guard_->is_checking(); }

    Subscription on(const std::string& event, EventHandler handler) {
        return guard_->on(event, std::move(handler));
    }

    const Config& config() const noexcept { return config_; }

  private:
    Config config_;
    std::unique_ptr<Guard> guard_;
};

// ActivationService implementation
ActivationService::ActivationService(Config config) {
    detail::set_debug_logging(config.debug);
    auto guard = make_guard(config);
    impl_ = std::make_unique<Impl>(std::move(config), std::move(guard));
}

ActivationService::ActivationService(Config config, std::unique_ptr<Guard> guard) {
    detail::set_debug_logging(config.debug);
    impl_ = std::make_unique<Impl>(std::move(config), std::move(guard));
}

ActivationService::~ActivationService() = default;

ActivationService::ActivationService(ActivationService&&) noexcept = default;
ActivationService& ActivationService::operator=(ActivationService&&) noexcept = default;

LicenseValidationResult ActivationService::verify_license() { return impl_->verify_license(); }

bool ActivationService::can_proceed() { return impl_->can_proceed(); }

ActivationOutcome ActivationService::activate(const std::string& license_key) {
    return impl_->activate(license_key);
}

DeactivationOutcome ActivationService::deactivate() { return impl_->deactivate(); }

DeviceInfoSummary ActivationService::get_current_device_info() const {
    return impl_->get_current_device_info();
}

std::optional<LicenseInfo> ActivationService::get_license_info() {
    return impl_->get_license_info();
}

bool ActivationService::is_first_run() const { return impl_->is_first_run(); }

void ActivationService::start_auto_validation() { impl_->start_auto_validation(); }

void ActivationService::stop_auto_validation() { impl_->stop_auto_validation(); }

bool ActivationService::is_auto_validating() const { return impl_->is_auto_validating(); }

Subscription ActivationService::on(const std::string& event, EventHandler handler) {
    return impl_->on(event, std::move(handler));
}

const Config& ActivationService::config() const noexcept { return impl_->config(); }

}  // namespace licenseguard
