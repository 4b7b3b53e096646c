#pragma once

/**
 * @file key_codec.hpp
 * @brief License key decoding and signature verification
 */

#include "licenseguard.hpp"

#include <string>

namespace licenseguard {

/**
 * @brief Decodes license keys and checks their HMAC-SHA256 signatures
 *
 * A key is either a raw JSON object or base64-encoded JSON. The signature
 * covers only the canonical subset {licenseId, licenseType, maxDays,
 * createdAt}, so features or metadata added by a third party never verify
 * as part of a signed key, and key order in the input does not matter.
 *
 * The same private key also seals activation records (see seal()).
 */
class KeyCodec {
  public:
    explicit KeyCodec(std::string signing_key);

    /**
     * @brief Decode key text into license data
     *
     * JSON parse is attempted first, then base64 decode followed by JSON parse.
     *
     * @return The decoded data, or ErrorCode::InvalidKey
     */
    [[nodiscard]] Result<RawLicenseData> decode(const std::string& text) const;

    /// True if data.signature matches the HMAC of the canonical payload
    [[nodiscard]] bool verify(const RawLicenseData& data) const;

    /// Compute the hex signature for data (key generation and tests)
    [[nodiscard]] std::string sign(const RawLicenseData& data) const;

    /// Encode data as a distributable base64 key
    [[nodiscard]] std::string encode(const RawLicenseData& data) const;

    /// Compute the seal of an activation record
    [[nodiscard]] std::string seal(const ActivatedLicenseData& license) const;

    /// True if license.activation_seal matches its contents
    [[nodiscard]] bool verify_seal(const ActivatedLicenseData& license) const;

    /// False when constructed without a signing key; nothing verifies then
    [[nodiscard]] bool has_signing_key() const noexcept { return !signing_key_.empty(); }

  private:
    std::string signing_key_;
};

}  // namespace licenseguard
