/**
 * @file upload_with_resume.cpp
 * @brief Upload a file to a Steam Deck and resume it after a dropped link
 *
 * This example demonstrates:
 * - Connecting with key or stored-password authentication
 * - Answering host trust and overwrite questions on the terminal
 * - Progress, speed and ETA from job_progress events
 * - Re-enqueueing a job that failed on connection loss, which resumes from
 *   the partial temp file on the device
 *
 * With --loopback <dir> the "device" is a local directory, which is handy
 * for trying the flow without a Steam Deck.
 */

#include <kcenon/deck_bridge/deck_bridge.h>
#include <kcenon/deck_bridge/core/logging.h>

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

using namespace kcenon::deck_bridge;

namespace {

std::mutex console_mutex;

auto ask_yes_no(const std::string& question) -> bool {
    std::lock_guard<std::mutex> lock(console_mutex);
    std::cout << std::endl << question << " [y/N] " << std::flush;
    std::string answer;
    std::getline(std::cin, answer);
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

void print_progress(const transfer_event& e) {
    std::lock_guard<std::mutex> lock(console_mutex);
    std::cout << "\r  " << human_readable_size(static_cast<int64_t>(e.bytes_transferred));
    if (e.total_bytes) {
        std::cout << " / " << human_readable_size(static_cast<int64_t>(*e.total_bytes));
    }
    std::cout << "  " << human_readable_size(static_cast<int64_t>(e.speed)) << "/s";
    if (e.eta) {
        std::cout << "  ETA " << std::chrono::duration_cast<std::chrono::seconds>(*e.eta).count()
                  << "s";
    } else {
        std::cout << "  ETA --";
    }
    std::cout << "        " << std::flush;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload With Resume Example - DeckBridge" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> <remote_path>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --host <host>        Device hostname or address (default: steamdeck.local)" << std::endl;
    std::cout << "  --user <name>        SSH user (default: deck)" << std::endl;
    std::cout << "  --key <path>         Private key (default: ~/.ssh/id_ed25519, ~/.ssh/id_rsa)" << std::endl;
    std::cout << "  --password-env <var> Read the password from this environment variable" << std::endl;
    std::cout << "  --loopback <dir>     Use a local directory as the device" << std::endl;
    std::cout << "  --retries <n>        Re-enqueue after a connection loss (default: 3)" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " game.iso /home/deck/Downloads/game.iso" << std::endl;
    std::cout << "  " << program << " --loopback /tmp/deck save.dat /home/deck/save.dat" << std::endl;
}

int main(int argc, char* argv[]) {
    device target;
    target.host = "steamdeck.local";
    credentials creds;
    std::optional<std::string> password_env;
    std::optional<std::string> loopback_root;
    int retries = 3;
    std::string local_path;
    std::string remote_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--host" && i + 1 < argc) {
            target.host = argv[++i];
        } else if (arg == "--user" && i + 1 < argc) {
            creds.username = argv[++i];
        } else if (arg == "--key" && i + 1 < argc) {
            creds.key_path = argv[++i];
        } else if (arg == "--password-env" && i + 1 < argc) {
            password_env = argv[++i];
            creds.method = auth_method::password;
        } else if (arg == "--loopback" && i + 1 < argc) {
            loopback_root = argv[++i];
        } else if (arg == "--retries" && i + 1 < argc) {
            retries = std::stoi(argv[++i]);
        } else if (local_path.empty()) {
            local_path = arg;
        } else if (remote_path.empty()) {
            remote_path = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    if (local_path.empty() || remote_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    get_logger().initialize();
    get_logger().set_level(log_level::warn);

    std::shared_ptr<channel_connector> connector;
    if (loopback_root) {
        connector = std::make_shared<local_connector>(*loopback_root);
        if (creds.method == auth_method::key && !creds.key_path) {
            // local_connector ignores credentials, but key lookup still runs
            creds.method = auth_method::password;
            password_env.reset();
        }
    } else {
#if DECK_BRIDGE_HAS_LIBSSH2
        connector = std::make_shared<sftp_connector>();
#else
        std::cerr << "Built without SFTP support; use --loopback <dir>" << std::endl;
        return 1;
#endif
    }

    auto config = bridge_config::builder().with_username(creds.username).build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    auto secrets = std::make_shared<memory_secret_store>();
    if (creds.method == auth_method::password) {
        std::string secret;
        if (password_env) {
            const char* value = std::getenv(password_env->c_str());
            if (!value) {
                std::cerr << "Environment variable " << *password_env << " is not set" << std::endl;
                return 1;
            }
            secret = value;
        }
        secrets->store(config.value().connection.secret_service,
                       creds.username + "@" + target.host, secret);
    }

    auto manager = connection_manager::builder()
                       .with_config(config.value().connection)
                       .with_connector(connector)
                       .with_secret_store(secrets)
                       .build();
    if (!manager) {
        std::cerr << "Failed to create connection manager: " << manager.error().message
                  << std::endl;
        return 1;
    }
    auto conn = manager.value();

    auto engine = transfer_engine::builder()
                      .with_config(config.value().transfer)
                      .with_channel_provider(conn)
                      .build();
    if (!engine) {
        std::cerr << "Failed to create transfer engine: " << engine.error().message << std::endl;
        return 1;
    }
    auto& transfers = engine.value();

    (void)conn->subscribe([&](const connection_event& e) {
        if (e.type == connection_event_type::host_trust_needed && e.identity) {
            std::thread([conn, identity = *e.identity] {
                bool accept = ask_yes_no("Unknown host " + identity.host + " (" +
                                         identity.key_type + " " + identity.fingerprint +
                                         "). Trust it?");
                auto answered = conn->answer_host_trust(accept ? trust_decision::accept_and_remember
                                                               : trust_decision::reject);
                if (!answered) {
                    std::cerr << "Trust answer ignored: " << answered.error().message << std::endl;
                }
            }).detach();
            return;
        }
        std::lock_guard<std::mutex> lock(console_mutex);
        std::cout << std::endl << "[connection] " << to_string(e.new_state);
        if (e.attempt > 0) {
            std::cout << " (retry " << e.attempt << " in " << e.retry_delay.count() << " ms)";
        }
        if (!e.reason.empty()) {
            std::cout << ": " << e.reason;
        }
        std::cout << std::endl;
    });

    (void)transfers.subscribe([&](const transfer_event& e) {
        switch (e.type) {
            case transfer_event_type::job_progress:
                print_progress(e);
                break;
            case transfer_event_type::overwrite_decision_needed:
                std::thread([&transfers, e] {
                    bool overwrite = ask_yes_no(e.path + " already exists. Overwrite?");
                    auto answered = transfers.answer_overwrite(
                        e.id, overwrite ? overwrite_decision::overwrite : overwrite_decision::skip);
                    if (!answered) {
                        std::cerr << "Overwrite answer ignored: " << answered.error().message
                                  << std::endl;
                    }
                }).detach();
                break;
            default:
                break;
        }
    });

    if (auto started = conn->connect(target, creds); !started) {
        std::cerr << "Cannot connect: " << started.error().message << std::endl;
        return 1;
    }

    auto request = transfer_request::upload(local_path, remote_path);
    for (int attempt = 0;; ++attempt) {
        auto id = transfers.enqueue(request);
        if (!id) {
            std::cerr << "Rejected: " << id.error().message << std::endl;
            return 1;
        }

        auto job = transfers.wait_for_job(id.value(), std::chrono::hours(24));
        if (!job) {
            std::cerr << std::endl << "Wait failed: " << job.error().message << std::endl;
            return 1;
        }

        const auto& done = job.value();
        std::cout << std::endl << "Job " << done.id.value << " " << to_string(done.status);
        if (done.resume_offset > 0) {
            std::cout << " (resumed at "
                      << human_readable_size(static_cast<int64_t>(done.resume_offset)) << ")";
        }
        std::cout << std::endl;

        if (done.status == transfer_status::completed || done.status == transfer_status::skipped) {
            break;
        }
        if (done.status != transfer_status::failed || !done.last_error ||
            !is_connection_loss(done.last_error->code) || attempt >= retries) {
            if (done.last_error) {
                std::cerr << "Error: " << done.last_error->message << std::endl;
            }
            return 1;
        }

        std::cout << "Connection lost, waiting to resume..." << std::endl;
        if (!conn->wait_for_state(connection_state::connected, std::chrono::seconds(60))) {
            if (conn->current_state() == connection_state::error) {
                if (auto again = conn->connect(target, creds); !again) {
                    std::cerr << "Reconnect failed: " << again.error().message << std::endl;
                    return 1;
                }
            }
            if (!conn->wait_for_state(connection_state::connected, std::chrono::seconds(60))) {
                std::cerr << "Device did not come back" << std::endl;
                return 1;
            }
        }
    }

    transfers.shutdown();
    if (auto closed = conn->disconnect(); !closed) {
        std::cerr << "Disconnect failed: " << closed.error().message << std::endl;
    }
    get_logger().shutdown();
    return 0;
}
