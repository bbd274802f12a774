/**
 * @file discover_devices.cpp
 * @brief Find Steam Decks on the local network
 *
 * This example demonstrates:
 * - mDNS lookup of steamdeck.local alongside a subnet scan on port 22
 * - Consuming devices as they are found with discovery_run::next()
 * - Names that arrive after a device was listed (device_updated)
 * - Telling "no network" apart from "nothing found"
 */

#include <kcenon/deck_bridge/deck_bridge.h>
#include <kcenon/deck_bridge/core/logging.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace kcenon::deck_bridge;

namespace {

std::atomic<bool> stop_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        stop_requested = true;
    }
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Discover Devices Example - DeckBridge" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --timeout <ms>       Stop the run after this long (default: until done)" << std::endl;
    std::cout << "  --range <first-last> Last-octet range to scan (default: 1-254)" << std::endl;
    std::cout << "  --workers <n>        Concurrent probes (default: 50)" << std::endl;
    std::cout << "  --port <port>        SSH port to probe (default: 22)" << std::endl;
    std::cout << "  --json-log           Log as JSON to stderr" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Press Ctrl+C to stop scanning early." << std::endl;
}

int main(int argc, char* argv[]) {
    std::chrono::milliseconds timeout{0};
    auto builder = bridge_config::builder();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeout = std::chrono::milliseconds(std::stoll(argv[++i]));
        } else if (arg == "--range" && i + 1 < argc) {
            std::string range = argv[++i];
            auto dash = range.find('-');
            if (dash == std::string::npos) {
                std::cerr << "Invalid range: " << range << std::endl;
                return 1;
            }
            builder.with_host_range(static_cast<uint32_t>(std::stoul(range.substr(0, dash))),
                                    static_cast<uint32_t>(std::stoul(range.substr(dash + 1))));
        } else if (arg == "--workers" && i + 1 < argc) {
            builder.with_scan_workers(static_cast<std::size_t>(std::stoul(argv[++i])));
        } else if (arg == "--port" && i + 1 < argc) {
            builder.with_ssh_port(static_cast<uint16_t>(std::stoi(argv[++i])));
        } else if (arg == "--json-log") {
            get_logger().set_output_format(log_output_format::json);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    auto config = builder.build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    get_logger().initialize();
    get_logger().set_level(log_level::warn);

    auto engine = discovery_engine::builder().with_config(config.value().discovery).build();
    if (!engine) {
        std::cerr << "Failed to create discovery engine: " << engine.error().message << std::endl;
        return 1;
    }

    (void)engine.value().subscribe([](const discovery_event& e) {
        if (e.type == discovery_event_type::device_updated && e.found) {
            std::cout << "  " << e.found->address << " is " << e.found->host << " ("
                      << to_string(e.found->via) << ")" << std::endl;
        }
    });

    auto run = engine.value().discover(timeout);
    if (!run) {
        std::cerr << "Discovery failed to start: " << run.error().message << std::endl;
        return 1;
    }
    auto active_run = run.value();
    std::signal(SIGINT, signal_handler);

    std::cout << "Scanning for devices on port " << config.value().discovery.port << "..."
              << std::endl;
    std::cout << std::left << std::setw(28) << "HOST" << std::setw(18) << "ADDRESS"
              << std::setw(8) << "VIA" << "LATENCY" << std::endl;

    for (;;) {
        if (stop_requested.exchange(false)) {
            active_run->cancel();
        }
        auto dev = active_run->next(std::chrono::milliseconds(200));
        if (!dev) {
            if (active_run->is_finished()) {
                break;
            }
            continue;
        }
        std::cout << std::left << std::setw(28) << dev->host << std::setw(18) << dev->address
                  << std::setw(8) << to_string(dev->via) << std::fixed << std::setprecision(1)
                  << dev->response_time.count() << " ms" << std::endl;
    }

    auto outcome = active_run->outcome();
    std::signal(SIGINT, SIG_DFL);

    if (!outcome) {
        std::cerr << "Discovery did not finish" << std::endl;
        return 1;
    }
    if (!outcome->has_value()) {
        std::cerr << "Discovery failed: " << outcome->error().message << std::endl;
        return 2;
    }

    const auto& summary = outcome->value();
    std::cout << std::endl
              << summary.device_count << " device(s) found in " << summary.elapsed.count()
              << " ms";
    if (summary.cancelled) {
        std::cout << " (cancelled)";
    } else if (summary.timed_out) {
        std::cout << " (timed out)";
    }
    std::cout << std::endl;

    get_logger().shutdown();
    return 0;
}
