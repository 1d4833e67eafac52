/**
 * @file upload_example.cpp
 * @brief Upload a file or directory tree into a directory-backed remote
 *
 * This example demonstrates:
 * - Building a session from a local and a remote provider
 * - Following aggregate and per-file progress
 * - Cancelling from the input poll handler (Ctrl+C)
 * - Reading the session log after the transfer
 */

#include <kcenon/tree_transfer/tree_transfer.h>
#include <kcenon/tree_transfer/core/format_utils.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace kcenon::tree_transfer;

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int) {
    g_interrupted.store(true);
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <local_path> <remote_root>\n"
              << "\n"
              << "Options:\n"
              << "  -d, --dir <path>     Destination directory below the remote root\n"
              << "  -n, --name <name>    Rename the uploaded entry\n"
              << "  -b, --buffer <size>  Copy buffer size in bytes (default: 65536)\n"
              << "  --help               Show this help message\n";
}

void print_progress(const transfer_progress& full, const transfer_progress& partial) {
    std::cout << "\r[" << std::setw(3) << full.calc_percentage() << "%] current file "
              << std::setw(3) << partial.calc_percentage() << "% "
              << format_bytes(full.transferred()) << " / " << format_bytes(full.total())
              << std::flush;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string local_path;
    std::string remote_root;
    std::string remote_dir;
    std::optional<std::string> rename;
    std::size_t buffer_size = engine_config{}.buffer_size;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-d" || arg == "--dir") {
            if (++i >= argc) {
                std::cerr << "Error: --dir requires an argument" << std::endl;
                return 1;
            }
            remote_dir = argv[i];
        } else if (arg == "-n" || arg == "--name") {
            if (++i >= argc) {
                std::cerr << "Error: --name requires an argument" << std::endl;
                return 1;
            }
            rename = argv[i];
        } else if (arg == "-b" || arg == "--buffer") {
            if (++i >= argc) {
                std::cerr << "Error: --buffer requires an argument" << std::endl;
                return 1;
            }
            buffer_size = static_cast<std::size_t>(std::stoull(argv[i]));
        } else if (arg[0] != '-') {
            if (local_path.empty()) {
                local_path = arg;
            } else {
                remote_root = arg;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (local_path.empty() || remote_root.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    get_logger().initialize();
    get_logger().set_console_output(false);

    auto source = std::filesystem::absolute(local_path);
    auto entry = make_fs_entry(source, source);
    if (!entry) {
        std::cerr << "Error: " << entry.error().message << std::endl;
        return 1;
    }

    engine_config config;
    config.buffer_size = buffer_size;

    connection_params params;
    params.address = "localhost";
    if (!remote_dir.empty()) {
        params.entry_directory = remote_dir;
    }

    auto session_result = session_controller::builder()
        .with_local_provider(std::make_unique<filesystem_local_provider>(source.parent_path()))
        .with_remote_provider(std::make_unique<directory_remote_provider>(remote_root))
        .with_connection_params(params)
        .with_engine_config(config)
        .build();
    if (!session_result) {
        std::cerr << "Failed to create session: " << session_result.error().message << std::endl;
        return 1;
    }
    auto& session = session_result.value();

    session.on_alert([](log_level, const std::string& message) {
        std::cerr << "\n[ALERT] " << message << std::endl;
    });
    session.on_fatal([](const std::string& message) {
        std::cerr << "[FATAL] " << message << std::endl;
    });

    if (auto connected = session.connect(); !connected) {
        return 1;
    }

    std::signal(SIGINT, on_sigint);
    session.engine().set_progress_handler(print_progress);
    session.engine().set_input_poll_handler([&session] {
        if (g_interrupted.load()) {
            session.abort_transfer();
        }
    });

    auto sent = is_file(entry.value())
        ? session.send(single_file{std::get<fs_file>(entry.value())}, rename)
        : session.send(single_entry{entry.value()}, rename);
    std::cout << std::endl;

    std::cout << "Throughput: " << format_throughput(static_cast<double>(
                                       session.engine().bytes_per_second()))
              << std::endl;

    // Oldest first
    for (auto it = session.logs().rbegin(); it != session.logs().rend(); ++it) {
        std::cout << "  " << log_level_to_string(it->level) << "  " << it->message << std::endl;
    }

    session.disconnect_and_quit();

    if (!sent) {
        std::cerr << "Upload failed: " << sent.error().message << std::endl;
        return 1;
    }
    return 0;
}
