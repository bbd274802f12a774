/**
 * @file deck_bridge.h
 * @brief Main header for the deck_bridge library
 * @version 0.1.0
 *
 * Include this header to get discovery, connection management and the
 * transfer queue.
 *
 * @code
 * #include <kcenon/deck_bridge/deck_bridge.h>
 *
 * using namespace kcenon::deck_bridge;
 *
 * auto discovery = discovery_engine::builder().build();
 * auto manager = connection_manager::builder()
 *     .with_connector(std::make_shared<sftp_connector>())
 *     .build();
 * auto transfers = transfer_engine::builder()
 *     .with_channel_provider(manager.value())
 *     .build();
 * @endcode
 */

#ifndef KCENON_DECK_BRIDGE_DECK_BRIDGE_H
#define KCENON_DECK_BRIDGE_DECK_BRIDGE_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/deck_bridge/core/error_codes.h"
#include "kcenon/deck_bridge/core/path_utils.h"
#include "kcenon/deck_bridge/core/types.h"

// Configuration
#include "kcenon/deck_bridge/config/bridge_config.h"

// Channels
#include "kcenon/deck_bridge/channel/local_channel.h"
#include "kcenon/deck_bridge/channel/secure_channel.h"
#include "kcenon/deck_bridge/channel/sftp_channel.h"

// Engines
#include "kcenon/deck_bridge/connection/connection_manager.h"
#include "kcenon/deck_bridge/discovery/discovery_engine.h"
#include "kcenon/deck_bridge/transfer/transfer_engine.h"

namespace kcenon::deck_bridge {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_DECK_BRIDGE_H
