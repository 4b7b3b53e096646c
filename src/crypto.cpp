#include "licenseguard/crypto.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace licenseguard {
namespace crypto {

// ==================== Base64 Encoding/Decoding ====================

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    std::unique_ptr<BIO, decltype(&BIO_free_all)> b64(BIO_new(BIO_f_base64()), BIO_free_all);
    if (!b64) {
        return "";
    }
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

    BIO* bmem = BIO_new(BIO_s_mem());
    if (bmem == nullptr) {
        return "";
    }
    BIO_push(b64.get(), bmem);

    if (BIO_write(b64.get(), data.data(), static_cast<int>(data.size())) <= 0) {
        return "";
    }
    (void)BIO_flush(b64.get());

    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64.get(), &bptr);
    if (bptr == nullptr) {
        return "";
    }

    return std::string(bptr->data, bptr->length);
}

std::string base64_encode(const std::string& data) {
    return base64_encode(std::vector<uint8_t>(data.begin(), data.end()));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    // Keys pasted from e-mail often carry line breaks
    std::string compact;
    compact.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact += c;
        }
    }

    if (compact.empty()) {
        return {};
    }

    bool alphabet_ok = std::all_of(compact.begin(), compact.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=';
    });
    if (!alphabet_ok) {
        return {};
    }

    while (compact.size() % 4 != 0) {
        compact += '=';
    }

    std::unique_ptr<BIO, decltype(&BIO_free_all)> b64(BIO_new(BIO_f_base64()), BIO_free_all);
    if (!b64) {
        return {};
    }
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

    BIO* bmem = BIO_new_mem_buf(compact.data(), static_cast<int>(compact.size()));
    if (bmem == nullptr) {
        return {};
    }
    BIO_push(b64.get(), bmem);

    std::vector<uint8_t> result(compact.size() * 3 / 4 + 1);

    int decoded_len = BIO_read(b64.get(), result.data(), static_cast<int>(result.size()));
    if (decoded_len > 0) {
        result.resize(static_cast<size_t>(decoded_len));
    } else {
        result.clear();
    }

    return result;
}

// ==================== Digests ====================

std::string hex_encode(const unsigned char* data, size_t length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        out += kDigits[(data[i] >> 4) & 0x0F];
        out += kDigits[data[i] & 0x0F];
    }
    return out;
}

std::string sha256_hex(const std::string& input) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        return "";
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return "";
    }

    if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
        return "";
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1) {
        return "";
    }

    return hex_encode(hash, len);
}

std::string hmac_sha256_hex(const std::string& key, const std::string& message) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    const unsigned char* result =
        HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(message.data()), message.size(), mac, &len);

    if (result == nullptr) {
        return "";
    }

    return hex_encode(mac, len);
}

bool digest_equals(const std::string& expected_hex, const std::string& actual_hex) {
    if (expected_hex.empty() || expected_hex.size() != actual_hex.size()) {
        return false;
    }

    std::string lhs = expected_hex;
    std::string rhs = actual_hex;
    auto lower = [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); };
    std::transform(lhs.begin(), lhs.end(), lhs.begin(), lower);
    std::transform(rhs.begin(), rhs.end(), rhs.begin(), lower);

    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace crypto
}  // namespace licenseguard
