/**
 * @file secret_store.h
 * @brief Secret lookup capability injected into connection_manager
 */

#ifndef KCENON_DECK_BRIDGE_CONNECTION_SECRET_STORE_H
#define KCENON_DECK_BRIDGE_CONNECTION_SECRET_STORE_H

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::deck_bridge {

/**
 * @brief Read access to stored passwords
 *
 * Backed by the OS keyring in the desktop application. deck_bridge only
 * reads; it never stores secrets itself.
 */
class secret_store {
public:
    virtual ~secret_store() = default;

    /**
     * @return std::nullopt when nothing is stored for @p account
     */
    [[nodiscard]] virtual auto lookup(const std::string& service, const std::string& account)
        -> std::optional<std::string> = 0;
};

/**
 * @brief In-process secret_store
 */
class memory_secret_store : public secret_store {
public:
    void store(const std::string& service, const std::string& account, std::string secret) {
        std::lock_guard<std::mutex> lock(mutex_);
        secrets_[{service, account}] = std::move(secret);
    }

    auto erase(const std::string& service, const std::string& account) -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return secrets_.erase({service, account}) > 0;
    }

    [[nodiscard]] auto lookup(const std::string& service, const std::string& account)
        -> std::optional<std::string> override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = secrets_.find({service, account});
        if (it == secrets_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::string> secrets_;
};

}  // namespace kcenon::deck_bridge

#endif  // KCENON_DECK_BRIDGE_CONNECTION_SECRET_STORE_H
