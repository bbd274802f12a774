/**
 * @file discovery_engine.cpp
 * @brief discovery_engine and discovery_run implementation
 */

#include "kcenon/deck_bridge/discovery/discovery_engine.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <unordered_set>

#include "kcenon/deck_bridge/adapters/thread_pool_adapter.h"
#include "kcenon/deck_bridge/core/event_queue.h"
#include "kcenon/deck_bridge/core/logging.h"

namespace kcenon::deck_bridge {

using discovery_dispatcher = event_dispatcher<discovery_event>;

// ============================================================================
// discovery_run::impl
// ============================================================================

struct discovery_run::impl {
    using clock = std::chrono::steady_clock;

    discovery_config config;
    std::shared_ptr<network_prober> prober;
    std::shared_ptr<discovery_dispatcher> events;
    std::chrono::milliseconds timeout_hint;

    mutable std::mutex mutex;
    mutable std::condition_variable cv;

    // Set on cancel() and when the run finishes; probes poll it.
    std::atomic<bool> abandon{false};
    bool cancel_requested = false;
    bool finished = false;
    std::size_t outstanding = 0;

    std::vector<device> emitted;
    std::unordered_set<std::string> emitted_addresses;
    std::deque<device> unread;
    std::optional<result<discovery_summary>> outcome;

    clock::time_point started;
    std::thread coordinator;

    impl(discovery_config cfg,
         std::shared_ptr<network_prober> p,
         std::shared_ptr<discovery_dispatcher> ev,
         std::chrono::milliseconds hint)
        : config(std::move(cfg)),
          prober(std::move(p)),
          events(std::move(ev)),
          timeout_hint(hint) {}

    void start() {
        started = clock::now();
        coordinator = std::thread([this] { run(); });
    }

    void request_cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (finished || cancel_requested) {
                return;
            }
            cancel_requested = true;
            abandon = true;
        }
        cv.notify_all();
        DB_LOG_INFO(log_category::discovery, "Discovery cancel requested");
    }

    auto elapsed() const -> std::chrono::milliseconds {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started);
    }

    // ------------------------------------------------------------------------
    // Emission (caller holds mutex)
    // ------------------------------------------------------------------------

    void emit_locked(device d) {
        emitted_addresses.insert(d.address);
        emitted.push_back(d);
        unread.push_back(d);

        bridge_log_context ctx;
        ctx.device_host = d.host;
        ctx.device_address = d.address;
        DB_LOG_INFO_CTX(log_category::discovery,
                        std::string("Found device via ") + to_string(d.via), ctx);

        events->publish(discovery_event::device_found(std::move(d)));
        cv.notify_all();
    }

    // Names arriving after emission rename the entry in place. mDNS names
    // replace anything; PTR names only replace the bare address.
    void rename_locked(const std::string& address, const std::string& host, discovery_source via) {
        auto it = std::find_if(emitted.begin(), emitted.end(),
                               [&address](const device& d) { return d.address == address; });
        if (it == emitted.end()) {
            return;
        }
        if (it->via == discovery_source::mdns && via != discovery_source::mdns) {
            return;
        }
        if (it->host == host && it->via == via) {
            return;
        }
        it->host = host;
        it->via = via;
        for (auto& pending : unread) {
            if (pending.address == address) {
                pending.host = host;
                pending.via = via;
            }
        }

        DB_LOG_DEBUG(log_category::discovery, "Device " + address + " is now known as " + host);
        events->publish(discovery_event::device_updated(*it));
        cv.notify_all();
    }

    // ------------------------------------------------------------------------
    // Probe results (worker threads)
    // ------------------------------------------------------------------------

    void on_mdns(device found) {
        std::lock_guard<std::mutex> lock(mutex);
        if (finished) {
            return;
        }
        if (emitted_addresses.contains(found.address)) {
            rename_locked(found.address, found.host, discovery_source::mdns);
            return;
        }
        emit_locked(std::move(found));
    }

    auto on_scan_hit(device d) -> bool {
        std::lock_guard<std::mutex> lock(mutex);
        if (finished || emitted_addresses.contains(d.address)) {
            return false;
        }
        emit_locked(std::move(d));
        return true;
    }

    void on_ptr_name(const std::string& address, const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        if (finished) {
            return;
        }
        rename_locked(address, name, discovery_source::scan);
    }

    void task_done() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --outstanding;
        }
        cv.notify_all();
    }

    void probe_mdns() {
        auto begin = clock::now();
        auto resolved = prober->resolve_host(config.mdns_hostname, config.mdns_timeout);
        if (!resolved) {
            DB_LOG_DEBUG(log_category::discovery,
                         "mDNS lookup for " + config.mdns_hostname +
                             " failed: " + resolved.error().message);
            return;
        }

        device d;
        d.host = config.mdns_hostname;
        d.address = resolved.value();
        d.response_time = std::chrono::duration_cast<probe_latency>(clock::now() - begin);
        d.via = discovery_source::mdns;
        on_mdns(std::move(d));
    }

    void probe_host(const std::string& address) {
        if (abandon) {
            return;
        }
        auto latency = prober->probe_port(address, config.port, config.probe_timeout, abandon);
        if (!latency || abandon) {
            return;
        }

        device d;
        d.host = address;
        d.address = address;
        d.response_time = latency.value();
        d.via = discovery_source::scan;
        if (!on_scan_hit(std::move(d)) || abandon) {
            return;
        }

        if (auto name = prober->reverse_lookup(address, config.probe_timeout); name && !abandon) {
            on_ptr_name(address, *name);
        }
    }

    auto guarded(std::function<void()> body, std::string stage) -> std::function<void()> {
        return [this, body = std::move(body), stage = std::move(stage)] {
            try {
                body();
            } catch (const std::exception& e) {
                DB_LOG_ERROR(log_category::discovery, stage + " task failed: " + e.what());
            }
            task_done();
        };
    }

    // ------------------------------------------------------------------------
    // Coordinator
    // ------------------------------------------------------------------------

    void fail(const error& err) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            finished = true;
            abandon = true;
            outcome = result<discovery_summary>(unexpected{err});
            events->publish(discovery_event::failed(err));
        }
        cv.notify_all();
        DB_LOG_ERROR(log_category::discovery, "Discovery failed: " + err.message);
    }

    void submit(adapters::worker_pool_interface& pool,
                std::function<void()> body,
                const std::string& stage) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++outstanding;
        }
        pool.submit_to_stage(guarded(std::move(body), stage), stage);
    }

    void run() {
        auto pool = adapters::worker_pool_factory::create(config.max_workers, "discovery");

        // The name lookup goes first so it never queues behind the scan.
        submit(*pool, [this] { probe_mdns(); }, "mdns");

        auto local = prober->local_ipv4_address();
        std::optional<std::string> base;
        if (local) {
            base = subnet_base(local.value());
        }
        if (!base) {
            fail(local ? error{error_code::no_network, "unusable local address " + local.value()}
                       : local.error());
            pool->shutdown();
            return;
        }

        DB_LOG_INFO(log_category::discovery,
                    "Scanning " + *base + ".0/24 on port " + std::to_string(config.port));

        for (auto host = config.first_host; host <= config.last_host; ++host) {
            if (abandon) {
                break;
            }
            auto address = *base + "." + std::to_string(host);
            submit(*pool, [this, address] { probe_host(address); }, "port_probe");
        }

        bool timed_out = false;
        {
            std::unique_lock<std::mutex> lock(mutex);
            const auto run_deadline = timeout_hint.count() > 0
                                          ? std::optional<clock::time_point>(started + timeout_hint)
                                          : std::nullopt;

            while (!cancel_requested && outstanding > 0) {
                if (run_deadline && clock::now() >= *run_deadline) {
                    timed_out = true;
                    break;
                }
                if (run_deadline) {
                    cv.wait_until(lock, *run_deadline);
                } else {
                    cv.wait(lock);
                }
            }

            finished = true;
            abandon = true;

            discovery_summary summary;
            summary.device_count = emitted.size();
            summary.cancelled = cancel_requested;
            summary.timed_out = timed_out;
            summary.elapsed = elapsed();
            outcome = result<discovery_summary>(summary);
            events->publish(
                discovery_event::complete(summary.device_count, summary.cancelled, timed_out));

            DB_LOG_INFO(log_category::discovery,
                        "Discovery complete: " + std::to_string(summary.device_count) +
                            " device(s) in " + std::to_string(summary.elapsed.count()) + "ms" +
                            (summary.cancelled ? " (cancelled)" : "") +
                            (timed_out ? " (timed out)" : ""));
        }
        cv.notify_all();

        // Abandoned probes notice the flag within one poll slice.
        pool->shutdown();
    }
};

// ============================================================================
// discovery_run
// ============================================================================

discovery_run::discovery_run(std::unique_ptr<impl> state) : impl_(std::move(state)) {}

discovery_run::~discovery_run() {
    if (!impl_) {
        return;
    }
    impl_->request_cancel();
    if (impl_->coordinator.joinable()) {
        impl_->coordinator.join();
    }
}

auto discovery_run::next(std::chrono::milliseconds wait) -> std::optional<device> {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->cv.wait_for(lock, wait, [this] { return impl_->finished || !impl_->unread.empty(); });
    if (impl_->unread.empty()) {
        return std::nullopt;
    }
    auto d = std::move(impl_->unread.front());
    impl_->unread.pop_front();
    return d;
}

void discovery_run::cancel() {
    impl_->request_cancel();
}

auto discovery_run::is_finished() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->finished;
}

auto discovery_run::wait_until_finished(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    return impl_->cv.wait_for(lock, timeout, [this] { return impl_->finished; });
}

auto discovery_run::devices() const -> std::vector<device> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->emitted;
}

auto discovery_run::outcome() const -> std::optional<result<discovery_summary>> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->outcome;
}

// ============================================================================
// discovery_engine
// ============================================================================

struct discovery_engine::impl {
    discovery_config config;
    std::shared_ptr<network_prober> prober;
    std::shared_ptr<discovery_dispatcher> events;

    mutable std::mutex mutex;
    std::weak_ptr<discovery_run> active;

    impl(discovery_config cfg, std::shared_ptr<network_prober> p)
        : config(std::move(cfg)),
          prober(std::move(p)),
          events(std::make_shared<discovery_dispatcher>("discovery_events")) {}
};

discovery_engine::builder::builder() = default;

auto discovery_engine::builder::with_config(const discovery_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto discovery_engine::builder::with_prober(std::shared_ptr<network_prober> prober) -> builder& {
    prober_ = std::move(prober);
    return *this;
}

auto discovery_engine::builder::build() -> result<discovery_engine> {
    if (auto valid = validate(config_); !valid) {
        return unexpected{valid.error()};
    }
    if (!prober_) {
        prober_ = std::make_shared<system_prober>();
    }
    return discovery_engine{std::move(config_), std::move(prober_)};
}

discovery_engine::discovery_engine(discovery_config config, std::shared_ptr<network_prober> prober)
    : impl_(std::make_unique<impl>(std::move(config), std::move(prober))) {
    get_logger().initialize();
}

discovery_engine::discovery_engine(discovery_engine&&) noexcept = default;
auto discovery_engine::operator=(discovery_engine&&) noexcept -> discovery_engine& = default;

discovery_engine::~discovery_engine() {
    if (!impl_) {
        return;
    }
    std::shared_ptr<discovery_run> current;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        current = impl_->active.lock();
    }
    if (current) {
        current->cancel();
    }
}

auto discovery_engine::discover(std::chrono::milliseconds timeout_hint)
    -> result<std::shared_ptr<discovery_run>> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (auto current = impl_->active.lock(); current && !current->is_finished()) {
        DB_LOG_WARN(log_category::discovery, "Discovery already running");
        return unexpected{error{error_code::invalid_state_transition,
                                "a discovery run is already active"}};
    }

    auto state = std::make_unique<discovery_run::impl>(impl_->config, impl_->prober,
                                                       impl_->events, timeout_hint);
    auto* raw = state.get();
    auto run = std::make_shared<discovery_run>(std::move(state));
    impl_->active = run;

    raw->start();
    DB_LOG_INFO(log_category::discovery, "Discovery started");
    return run;
}

auto discovery_engine::is_running() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto current = impl_->active.lock();
    return current && !current->is_finished();
}

auto discovery_engine::subscribe(listener fn) -> subscription_id {
    return impl_->events->subscribe(std::move(fn));
}

auto discovery_engine::unsubscribe(subscription_id id) -> bool {
    return impl_->events->unsubscribe(id);
}

auto discovery_engine::wait_for_events(std::chrono::milliseconds timeout) -> bool {
    return impl_->events->wait_idle(timeout);
}

auto discovery_engine::config() const -> const discovery_config& {
    return impl_->config;
}

}  // namespace kcenon::deck_bridge
