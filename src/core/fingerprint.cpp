/**
 * @file fingerprint.cpp
 * @brief SHA-256 host key fingerprints via OpenSSL EVP
 */

#include "kcenon/deck_bridge/core/fingerprint.h"

#include <openssl/evp.h>

#include <array>

namespace kcenon::deck_bridge {

auto sha256_fingerprint(std::span<const std::byte> key_blob) -> result<std::string> {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    if (EVP_Digest(key_blob.data(), key_blob.size(), digest.data(), &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        return unexpected{error{error_code::internal_error, "EVP_Digest(SHA256) failed"}};
    }

    // 4 output chars per 3 input bytes, plus the terminator
    std::array<unsigned char, ((EVP_MAX_MD_SIZE + 2) / 3) * 4 + 1> encoded{};
    int encoded_len = EVP_EncodeBlock(encoded.data(), digest.data(),
                                      static_cast<int>(digest_len));
    if (encoded_len < 0) {
        return unexpected{error{error_code::internal_error, "EVP_EncodeBlock failed"}};
    }

    std::string b64(reinterpret_cast<const char*>(encoded.data()),
                    static_cast<size_t>(encoded_len));
    while (!b64.empty() && b64.back() == '=') {
        b64.pop_back();
    }
    return "SHA256:" + b64;
}

auto sha256_fingerprint(const std::string& key_blob) -> result<std::string> {
    return sha256_fingerprint(
        std::span<const std::byte>(reinterpret_cast<const std::byte*>(key_blob.data()),
                                   key_blob.size()));
}

}  // namespace kcenon::deck_bridge
