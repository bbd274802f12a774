/**
 * @file connection_manager.cpp
 * @brief connection_manager implementation
 */

#include "kcenon/deck_bridge/connection/connection_manager.h"

#include <condition_variable>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <limits>
#include <mutex>
#include <optional>

#include "kcenon/deck_bridge/adapters/thread_pool_adapter.h"
#include "kcenon/deck_bridge/core/event_queue.h"
#include "kcenon/deck_bridge/core/logging.h"
#include "kcenon/deck_bridge/core/path_utils.h"

namespace kcenon::deck_bridge {

namespace {

constexpr std::size_t supervisor_workers = 2;

auto home_directory() -> std::filesystem::path {
    const char* home = std::getenv("HOME");
    return home ? std::filesystem::path(home) : std::filesystem::path{};
}

auto expand_user(const std::string& path) -> std::string {
    if (path == "~" || path.starts_with("~/")) {
        return (home_directory() / path.substr(path.size() > 1 ? 2 : 1)).string();
    }
    return path;
}

}  // namespace

auto default_key_candidates() -> std::vector<std::string> {
    std::vector<std::string> keys;
    auto home = home_directory();
    if (home.empty()) {
        return keys;
    }
    for (const char* name : {"id_ed25519", "id_rsa"}) {
        auto candidate = home / ".ssh" / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            keys.push_back(candidate.string());
        }
    }
    return keys;
}

struct connection_manager::impl {
    connection_config config;
    std::shared_ptr<channel_connector> connector;
    std::shared_ptr<secret_store> secrets;
    event_dispatcher<connection_event> events{"connection_events"};

    // State machine. Events are published while state_mutex is held so
    // subscribers see transitions in the order they happened.
    mutable std::mutex state_mutex;
    mutable std::condition_variable state_cv;
    connection_state state{connection_state::disconnected};
    uint64_t generation{0};
    std::optional<error> drop_error;
    std::optional<host_identity> pending_trust;
    std::optional<trust_decision> trust_answer;

    // Lock order: state_mutex before channel_mutex.
    std::mutex channel_mutex;
    std::unique_ptr<secure_channel> channel;
    uint64_t channel_generation{0};

    std::shared_ptr<adapters::worker_pool_interface> supervisors;

    impl(connection_config cfg,
         std::shared_ptr<channel_connector> conn,
         std::shared_ptr<secret_store> store)
        : config(std::move(cfg)),
          connector(std::move(conn)),
          secrets(std::move(store)),
          supervisors(adapters::worker_pool_factory::create(supervisor_workers,
                                                            "connection_supervisor")) {}

    // ------------------------------------------------------------------------
    // State machine
    // ------------------------------------------------------------------------

    auto set_state_locked(connection_state to,
                          std::string reason,
                          std::optional<error> failure = std::nullopt,
                          std::size_t attempt = 0,
                          std::chrono::milliseconds delay = std::chrono::milliseconds{0}) -> bool {
        if (!is_transition_allowed(state, to)) {
            DB_LOG_ERROR(log_category::connection,
                         std::string("Rejected transition ") + to_string(state) + " -> " +
                             to_string(to) + " (" + reason + ")");
            return false;
        }

        connection_event e;
        e.type = connection_event_type::state_changed;
        e.old_state = state;
        e.new_state = to;
        e.reason = std::move(reason);
        e.failure = std::move(failure);
        e.attempt = attempt;
        e.retry_delay = delay;

        DB_LOG_INFO(log_category::connection, std::string("Connection state ") +
                                                  to_string(e.old_state) + " -> " +
                                                  to_string(to) + ": " + e.reason);

        state = to;
        events.publish(std::move(e));
        state_cv.notify_all();
        return true;
    }

    /**
     * @brief Transition on behalf of supervisor generation @p gen
     * @return false when @p gen is stale or the table rejects it
     */
    auto transition(uint64_t gen,
                    connection_state to,
                    std::string reason,
                    std::optional<error> failure = std::nullopt,
                    std::size_t attempt = 0,
                    std::chrono::milliseconds delay = std::chrono::milliseconds{0}) -> bool {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (gen != generation) {
            return false;
        }
        return set_state_locked(to, std::move(reason), std::move(failure), attempt, delay);
    }

    auto is_current(uint64_t gen) const -> bool {
        std::lock_guard<std::mutex> lock(state_mutex);
        return gen == generation;
    }

    /**
     * @brief Report that the connected channel is gone
     */
    auto mark_lost(uint64_t gen, const error& err) -> bool {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (gen != generation || state != connection_state::connected) {
            return false;
        }
        drop_error = err;
        return set_state_locked(connection_state::connecting, "connection lost: " + err.message,
                                err);
    }

    // ------------------------------------------------------------------------
    // Channel ownership
    // ------------------------------------------------------------------------

    /**
     * @brief Install @p opened and move to connected, unless superseded
     */
    auto promote(uint64_t gen, std::unique_ptr<secure_channel> opened) -> bool {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (gen != generation) {
            if (auto closed = opened->close(); !closed) {
                DB_LOG_WARN(log_category::connection,
                            "Closing superseded channel failed: " + closed.error().message);
            }
            return false;
        }
        {
            std::lock_guard<std::mutex> channel_lock(channel_mutex);
            channel = std::move(opened);
            channel_generation = gen;
        }
        drop_error.reset();
        return set_state_locked(connection_state::connected, "connected");
    }

    /**
     * @brief Close the channel if it belongs to a generation before @p limit
     */
    void close_channel_before(uint64_t limit) {
        std::unique_ptr<secure_channel> victim;
        {
            std::lock_guard<std::mutex> lock(channel_mutex);
            if (channel && channel_generation < limit) {
                victim = std::move(channel);
            }
        }
        if (victim) {
            if (auto closed = victim->close(); !closed) {
                DB_LOG_WARN(log_category::connection,
                            "Channel close failed: " + closed.error().message);
            }
        }
    }

    // ------------------------------------------------------------------------
    // Supervisor
    // ------------------------------------------------------------------------

    /**
     * @brief Sleep for @p delay unless generation @p gen is superseded
     * @return false when superseded
     */
    auto wait_backoff(uint64_t gen, std::chrono::milliseconds delay) -> bool {
        std::unique_lock<std::mutex> lock(state_mutex);
        return !state_cv.wait_for(lock, delay, [&] { return gen != generation; });
    }

    auto trust_callback(uint64_t gen) -> host_trust_callback {
        return [this, gen](const host_identity& identity) -> trust_decision {
            std::unique_lock<std::mutex> lock(state_mutex);
            if (gen != generation) {
                return trust_decision::reject;
            }
            pending_trust = identity;
            trust_answer.reset();

            connection_event e;
            e.type = connection_event_type::host_trust_needed;
            e.old_state = state;
            e.new_state = state;
            e.reason = "unknown host key " + identity.fingerprint;
            e.identity = identity;
            events.publish(std::move(e));

            DB_LOG_INFO(log_category::connection,
                        "Waiting for trust decision on " + identity.host + " (" +
                            identity.key_type + " " + identity.fingerprint + ")");

            state_cv.wait(lock, [&] { return gen != generation || trust_answer.has_value(); });

            auto decision = (gen == generation) ? *trust_answer : trust_decision::reject;
            pending_trust.reset();
            trust_answer.reset();
            return decision;
        };
    }

    /**
     * @brief One connect cycle: immediate attempt plus retries, or retries only
     *
     * An initial connect makes 1 + max_attempts tries; a reconnect after a
     * drop (@p cause set) makes max_attempts tries. Only retryable errors
     * are retried.
     */
    auto attempt_cycle(uint64_t gen,
                       const connection_request& request,
                       const std::optional<error>& cause)
        -> result<std::unique_ptr<secure_channel>> {
        const auto& policy = config.reconnect;
        const bool initial = !cause.has_value();
        const std::size_t tries = initial ? policy.max_attempts + 1 : policy.max_attempts;
        error last = cause.value_or(error{error_code::host_unreachable});

        for (std::size_t attempt = 1; attempt <= tries; ++attempt) {
            const std::size_t retry = initial ? attempt - 1 : attempt;
            if (retry > 0) {
                auto delay = policy.delay_for_attempt(retry);

                bridge_log_context ctx;
                ctx.device_host = request.host;
                ctx.attempt = static_cast<uint32_t>(retry);
                ctx.delay_ms = static_cast<uint64_t>(delay.count());
                DB_LOG_INFO_CTX(log_category::connection, "Scheduling reconnect", ctx);

                if (!transition(gen, connection_state::connecting,
                                "retry " + std::to_string(retry) + "/" +
                                    std::to_string(policy.max_attempts),
                                last, retry, delay)) {
                    return unexpected{error{error_code::cancelled, "connect superseded"}};
                }
                if (!wait_backoff(gen, delay)) {
                    return unexpected{error{error_code::cancelled, "connect superseded"}};
                }
            }
            if (!is_current(gen)) {
                return unexpected{error{error_code::cancelled, "connect superseded"}};
            }

            auto opened = connector->open(request, trust_callback(gen));
            if (opened) {
                return opened;
            }

            last = opened.error();
            DB_LOG_WARN(log_category::connection,
                        "Connect attempt " + std::to_string(attempt) + " to " + request.host +
                            " failed: " + last.message);
            if (!is_retryable(last.code)) {
                return unexpected{last};
            }
        }

        DB_LOG_ERROR(log_category::connection,
                     "All reconnect attempts exhausted for " + request.host);
        return unexpected{error{last.code, "gave up after " + std::to_string(tries) +
                                               " attempt(s): " + last.message}};
    }

    /**
     * @brief Keepalive loop for the connected state
     * @return The loss that ended the connection; std::nullopt when superseded
     */
    auto watch(uint64_t gen) -> std::optional<error> {
        for (;;) {
            {
                std::unique_lock<std::mutex> lock(state_mutex);
                state_cv.wait_for(lock, config.keepalive_interval, [&] {
                    return gen != generation || state != connection_state::connected;
                });
                if (gen != generation) {
                    return std::nullopt;
                }
                if (state != connection_state::connected) {
                    return drop_error.value_or(error{error_code::host_unreachable});
                }
            }

            result<void> alive;
            {
                std::lock_guard<std::mutex> lock(channel_mutex);
                if (!channel || !channel->is_open()) {
                    alive = unexpected{error{error_code::host_unreachable, "channel closed"}};
                } else {
                    alive = channel->keepalive();
                }
            }
            if (!alive) {
                DB_LOG_WARN(log_category::connection,
                            "Keepalive failed: " + alive.error().message);
                if (!mark_lost(gen, alive.error())) {
                    return is_current(gen) ? std::optional<error>(alive.error()) : std::nullopt;
                }
                return alive.error();
            }
        }
    }

    void supervise(uint64_t gen, const connection_request& request) {
        std::optional<error> cause;
        for (;;) {
            auto opened = attempt_cycle(gen, request, cause);
            if (!opened) {
                transition(gen, connection_state::error, opened.error().message, opened.error());
                return;
            }
            if (!promote(gen, std::move(opened.value()))) {
                return;
            }

            cause = watch(gen);
            close_channel_before(gen + 1);
            if (!cause) {
                return;
            }
        }
    }

    // ------------------------------------------------------------------------
    // Request construction
    // ------------------------------------------------------------------------

    auto build_request(const device& target, const credentials& creds)
        -> result<connection_request> {
        connection_request request;
        request.host = target.host.empty() ? target.address : target.host;
        request.address = target.address;
        request.port = config.port;
        request.username = creds.username.empty() ? config.default_username : creds.username;
        request.method = creds.method;
        request.known_hosts_path = config.known_hosts_path;
        request.timeout = config.connect_timeout;

        if (request.host.empty()) {
            return unexpected{error{error_code::invalid_configuration, "device has no address"}};
        }

        const auto account = request.username + "@" + request.host;

        if (creds.method == auth_method::password) {
            auto secret = secrets ? secrets->lookup(config.secret_service, account)
                                  : std::optional<std::string>{};
            if (!secret) {
                return unexpected{error{error_code::authentication_failure,
                                        "no stored password for " + account}};
            }
            request.password = std::move(*secret);
            return request;
        }

        if (creds.key_path && !creds.key_path->empty()) {
            auto path = expand_user(*creds.key_path);
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec)) {
                return unexpected{error{error_code::authentication_failure,
                                        "key file not found: " + path}};
            }
            request.key_paths.push_back(path);
        } else {
            request.key_paths = default_key_candidates();
        }

        if (request.key_paths.empty()) {
            return unexpected{error{error_code::authentication_failure,
                                    "no SSH key found for " + account}};
        }
        return request;
    }
};

// ============================================================================
// Builder
// ============================================================================

connection_manager::builder::builder() = default;

auto connection_manager::builder::with_config(const connection_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto connection_manager::builder::with_connector(std::shared_ptr<channel_connector> connector)
    -> builder& {
    connector_ = std::move(connector);
    return *this;
}

auto connection_manager::builder::with_secret_store(std::shared_ptr<secret_store> secrets)
    -> builder& {
    secrets_ = std::move(secrets);
    return *this;
}

auto connection_manager::builder::build() -> result<std::shared_ptr<connection_manager>> {
    if (!connector_) {
        return unexpected{error{error_code::invalid_configuration,
                                "connection_manager requires a channel_connector"}};
    }
    if (auto valid = validate(config_); !valid) {
        return unexpected{valid.error()};
    }
    if (!secrets_) {
        secrets_ = std::make_shared<memory_secret_store>();
    }
    return std::shared_ptr<connection_manager>(
        new connection_manager(std::move(config_), std::move(connector_), std::move(secrets_)));
}

// ============================================================================
// connection_manager
// ============================================================================

connection_manager::connection_manager(connection_config config,
                                       std::shared_ptr<channel_connector> connector,
                                       std::shared_ptr<secret_store> secrets)
    : impl_(std::make_unique<impl>(std::move(config), std::move(connector), std::move(secrets))) {
    get_logger().initialize();
}

connection_manager::~connection_manager() {
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        ++impl_->generation;
    }
    impl_->state_cv.notify_all();
    impl_->supervisors->shutdown();
    impl_->close_channel_before(std::numeric_limits<uint64_t>::max());
    impl_->events.stop();
}

auto connection_manager::connect(const device& target, const credentials& creds)
    -> result<void> {
    auto request = impl_->build_request(target, creds);
    if (!request) {
        DB_LOG_ERROR(log_category::connection, "Connect rejected: " + request.error().message);
        return unexpected{request.error()};
    }

    uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (impl_->state == connection_state::connecting ||
            impl_->state == connection_state::connected) {
            return unexpected{error{error_code::invalid_state_transition,
                                    std::string("connect while ") + to_string(impl_->state)}};
        }
        gen = ++impl_->generation;
        impl_->set_state_locked(connection_state::connecting,
                                "connecting to " + request.value().username + "@" +
                                    request.value().host);
    }
    impl_->state_cv.notify_all();

    auto* self = impl_.get();
    impl_->supervisors->submit_to_stage(
        [self, gen, req = std::move(request.value())] {
            try {
                self->supervise(gen, req);
            } catch (const std::exception& e) {
                DB_LOG_ERROR(log_category::connection,
                             std::string("Connection supervisor failed: ") + e.what());
                self->transition(gen, connection_state::error, e.what(),
                                 error{error_code::internal_error, e.what()});
            }
        },
        "connect_cycle");
    return {};
}

auto connection_manager::disconnect() -> result<void> {
    uint64_t limit = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (impl_->state == connection_state::disconnected) {
            return {};
        }
        limit = ++impl_->generation;
        impl_->set_state_locked(connection_state::disconnected, "disconnect requested");
    }
    impl_->state_cv.notify_all();

    // Waits for an operation holding the channel to return.
    impl_->close_channel_before(limit);
    return {};
}

auto connection_manager::current_state() const -> connection_state {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->state;
}

auto connection_manager::answer_host_trust(trust_decision decision) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (!impl_->pending_trust || impl_->trust_answer) {
            return unexpected{error{error_code::invalid_state_transition,
                                    "no host trust decision pending"}};
        }
        impl_->trust_answer = decision;
    }
    impl_->state_cv.notify_all();
    return {};
}

auto connection_manager::wait_for_state(connection_state state,
                                        std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock<std::mutex> lock(impl_->state_mutex);
    return impl_->state_cv.wait_for(lock, timeout, [&] { return impl_->state == state; });
}

auto connection_manager::list_directory(const std::string& path)
    -> result<std::vector<remote_entry>> {
    if (auto valid = validate_remote_path(path); !valid) {
        return unexpected{valid.error()};
    }
    std::vector<remote_entry> entries;
    auto done = use_channel([&](secure_channel& ch) -> result<void> {
        auto listed = ch.list_directory(path);
        if (!listed) {
            return unexpected{listed.error()};
        }
        entries = std::move(listed.value());
        return {};
    });
    if (!done) {
        return unexpected{done.error()};
    }
    return entries;
}

auto connection_manager::subscribe(listener fn) -> subscription_id {
    return impl_->events.subscribe(std::move(fn));
}

auto connection_manager::unsubscribe(subscription_id id) -> bool {
    return impl_->events.unsubscribe(id);
}

auto connection_manager::wait_for_events(std::chrono::milliseconds timeout) -> bool {
    return impl_->events.wait_idle(timeout);
}

auto connection_manager::config() const -> const connection_config& {
    return impl_->config;
}

auto connection_manager::is_channel_available() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->state == connection_state::connected;
}

auto connection_manager::use_channel(
    const std::function<result<void>(secure_channel&)>& operation) -> result<void> {
    uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (impl_->state != connection_state::connected) {
            return unexpected{error{error_code::host_unreachable,
                                    std::string("not connected (") + to_string(impl_->state) +
                                        ")"}};
        }
        gen = impl_->generation;
    }

    result<void> outcome;
    {
        std::lock_guard<std::mutex> lock(impl_->channel_mutex);
        if (!impl_->channel || impl_->channel_generation != gen || !impl_->channel->is_open()) {
            outcome = unexpected{error{error_code::host_unreachable, "channel closed"}};
        } else {
            outcome = operation(*impl_->channel);
        }
    }

    if (!outcome && is_connection_loss(outcome.error().code)) {
        impl_->mark_lost(gen, outcome.error());
    }
    return outcome;
}

}  // namespace kcenon::deck_bridge
