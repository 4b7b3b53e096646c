#pragma once

/**
 * @file guard.hpp
 * @brief Orchestration of activation, deactivation and license checks
 */

#include "events.hpp"
#include "fingerprint.hpp"
#include "key_codec.hpp"
#include "licenseguard.hpp"
#include "registry.hpp"
#include "storage.hpp"
#include "validator.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>

namespace licenseguard {

/// Source of the current time
using Clock = std::function<Timestamp()>;

/// Outcome of a license check
struct GuardDecision {
    LicenseValidationResult result;
    bool can_proceed = false;  // true only for VALID
};

struct GuardOptions {
    /// Days before expiry at which a license is reported as expiring soon
    int warning_days = 7;

    /// Interval for periodic checks in seconds (0 disables them)
    double check_interval_seconds = 10.0;
};

/**
 * @brief Serializes all license operations against one installation
 *
 * activate() and deactivate() take the guard lock exclusively, checks take it
 * shared, so a check never observes a half-finished activation.
 *
 * Every failure path is closed: an exception anywhere in a check yields
 * can_proceed == false, and a failed activation leaves the store and the
 * registry as they were.
 *
 * Thread Safety: All public methods are thread-safe. Event handlers run on
 * the calling thread (or the periodic-check thread) after the guard lock is
 * released, so they may call back into the guard. A handler must not destroy
 * the guard (or drop its last owner): the guard is still emitting when the
 * handler returns.
 */
class Guard {
  public:
    Guard(std::shared_ptr<StorageInterface> storage, std::shared_ptr<RegistryInterface> registry,
          std::shared_ptr<FingerprintEngine> fingerprints, KeyCodec codec,
          GuardOptions options = {}, Clock clock = nullptr);

    /// Stops periodic checks; must not run on the periodic-check thread
    ~Guard();

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    Guard(Guard&&) = delete;
    Guard& operator=(Guard&&) = delete;

    /// Read the store, fingerprint this device, consult the registry and validate
    [[nodiscard]] GuardDecision verify_license();

    /**
     * @brief Activate a license key on this device
     *
     * decode -> verify -> fingerprint -> register -> store. Either every step
     * succeeds or no persistent state changes.
     */
    [[nodiscard]] Result<ActivatedLicenseData> activate(const std::string& license_key);

    /**
     * @brief Release the license in the registry, then erase the record
     *
     * If erasing fails after the release committed, the registry already
     * blocks the key and the next check reports DEACTIVATED.
     */
    [[nodiscard]] Result<void> deactivate();

    /// Fresh fingerprint of this device
    [[nodiscard]] DeviceFingerprint current_fingerprint() const;

    /// The stored activation record, if any
    [[nodiscard]] Result<std::optional<ActivatedLicenseData>> stored_license();

    /// True if any record is present, even one that cannot be parsed
    [[nodiscard]] bool has_stored_license();

    /// Start re-checking on a background thread every check_interval_seconds
    void start_periodic_checks();

    /**
     * @brief Stop periodic checks; returns once the worker has exited
     *
     * From a handler on the worker thread it only requests the stop. No
     * further guard:cycle event is emitted after the request.
     */
    void stop_periodic_checks();

    [[nodiscard]] bool is_checking() const noexcept { return checking_; }

    /// Status reported by the most recent check
    [[nodiscard]] std::optional<LicenseStatus> last_status() const;

    /// Subscribe to guard events (see events.hpp)
    Subscription on(const std::string& event, EventHandler handler);

    [[nodiscard]] Timestamp now() const { return clock_(); }

    [[nodiscard]] const GuardOptions& options() const noexcept { return options_; }

  private:
    GuardDecision check_locked();
    Result<ActivatedLicenseData> activate_locked(const std::string& license_key);
    Result<void> deactivate_locked(std::string& released_id);
    void publish(const GuardDecision& decision);
    bool halt_worker();  // requires control_mutex_

    std::shared_ptr<StorageInterface> storage_;
    std::shared_ptr<RegistryInterface> registry_;
    std::shared_ptr<FingerprintEngine> fingerprints_;
    KeyCodec codec_;
    Validator validator_;
    GuardOptions options_;
    Clock clock_;

    mutable std::shared_mutex mutex_;

    mutable std::mutex status_mutex_;
    std::optional<LicenseStatus> last_status_;

    EventBus event_bus_;

    // Periodic checks
    std::mutex control_mutex_;
    std::atomic<bool> checking_{false};
    std::atomic<std::thread::id> worker_id_{};
    std::thread worker_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

}  // namespace licenseguard
