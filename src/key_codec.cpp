#include "licenseguard/key_codec.hpp"
#include "licenseguard/crypto.hpp"
#include "licenseguard/json.hpp"

#include <algorithm>
#include <cctype>

namespace licenseguard {

namespace {

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); })
                   .base();
    return begin < end ? std::string(begin, end) : std::string();
}

}  // namespace

KeyCodec::KeyCodec(std::string signing_key) : signing_key_(std::move(signing_key)) {}

Result<RawLicenseData> KeyCodec::decode(const std::string& text) const {
    std::string key = trim(text);
    if (key.empty()) {
        return Result<RawLicenseData>::error(ErrorCode::InvalidKey, "License key is empty");
    }

    auto parsed = nlohmann::json::parse(key, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        std::vector<uint8_t> bytes = crypto::base64_decode(key);
        if (bytes.empty()) {
            return Result<RawLicenseData>::error(ErrorCode::InvalidKey,
                                                 "License key is neither JSON nor base64");
        }
        parsed = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
        if (parsed.is_discarded()) {
            return Result<RawLicenseData>::error(ErrorCode::InvalidKey,
                                                 "License key does not contain valid JSON");
        }
    }

    return json::parse_raw_license(parsed);
}

bool KeyCodec::verify(const RawLicenseData& data) const {
    if (signing_key_.empty() || data.signature.empty()) {
        return false;
    }
    return crypto::digest_equals(sign(data), data.signature);
}

std::string KeyCodec::sign(const RawLicenseData& data) const {
    return crypto::hmac_sha256_hex(signing_key_, json::canonical_key_payload(data));
}

std::string KeyCodec::encode(const RawLicenseData& data) const {
    return crypto::base64_encode(json::raw_license_to_json(data).dump());
}

std::string KeyCodec::seal(const ActivatedLicenseData& license) const {
    return crypto::hmac_sha256_hex(signing_key_, json::canonical_seal_payload(license));
}

bool KeyCodec::verify_seal(const ActivatedLicenseData& license) const {
    if (signing_key_.empty() || license.activation_seal.empty()) {
        return false;
    }
    return crypto::digest_equals(seal(license), license.activation_seal);
}

}  // namespace licenseguard
