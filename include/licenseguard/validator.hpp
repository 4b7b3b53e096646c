#pragma once

/**
 * @file validator.hpp
 * @brief Deterministic license state machine
 */

#include "key_codec.hpp"
#include "licenseguard.hpp"

#include <functional>
#include <optional>

namespace licenseguard {

/// Registry lookup by license id; nullopt when the id was never registered
using RegistryLookup = std::function<std::optional<RegistryEntry>(const std::string&)>;

/**
 * @brief Pure validation of a stored activation
 *
 * validate() has no hidden state: the same arguments always give the same
 * result. Checks run in a fixed order so that tampering and deactivation
 * are reported even when the record is also expired or on another device:
 *
 * 1. no record                                   -> NOT_ACTIVATED
 * 2. key signature, original signature or seal    -> TAMPERED
 * 3. registry entry missing or bound elsewhere   -> TAMPERED
 *    registry entry deactivated                  -> DEACTIVATED
 * 4. fingerprint mismatch                        -> DEVICE_MISMATCH
 * 5. now >= expires_at                           -> EXPIRED
 * 6. otherwise                                   -> VALID
 */
class Validator {
  public:
    explicit Validator(KeyCodec codec, int warning_days = 7);

    [[nodiscard]] LicenseValidationResult validate(const std::optional<ActivatedLicenseData>& stored,
                                                   const DeviceFingerprint& current, Timestamp now,
                                                   const RegistryLookup& lookup) const;

    /// Whole days left until expires_at, rounded up; 0 once expired
    [[nodiscard]] static int remaining_days(Timestamp expires_at, Timestamp now) noexcept;

    [[nodiscard]] int warning_days() const noexcept { return warning_days_; }

  private:
    KeyCodec codec_;
    int warning_days_;
};

}  // namespace licenseguard
