/**
 * @file fingerprint.h
 * @brief OpenSSH-style host key fingerprints
 */

#ifndef KCENON_DECK_BRIDGE_CORE_FINGERPRINT_H
#define KCENON_DECK_BRIDGE_CORE_FINGERPRINT_H

#include <cstddef>
#include <span>
#include <string>

#include "kcenon/deck_bridge/core/types.h"

namespace kcenon::deck_bridge {

/**
 * @brief Compute "SHA256:<base64>" over a raw host key blob
 *
 * Matches the format printed by ssh-keygen -lf: unpadded standard base64 of
 * the SHA-256 digest.
 */
[[nodiscard]] auto sha256_fingerprint(std::span<const std::byte> key_blob) -> result<std::string>;

/**
 * @brief Convenience overload for key material held in a string
 */
[[nodiscard]] auto sha256_fingerprint(const std::string& key_blob) -> result<std::string>;

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CORE_FINGERPRINT_H
