/**
 * @file download_example.cpp
 * @brief Browse a directory-backed remote and download entries from it
 *
 * This example demonstrates:
 * - Navigating the remote with the session directory history
 * - Downloading a selection into the local working directory
 * - Fetching a single file into a cache directory for viewing
 */

#include <kcenon/tree_transfer/tree_transfer.h>
#include <kcenon/tree_transfer/core/format_utils.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::tree_transfer;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <remote_root> <remote_dir> [names...]\n"
              << "\n"
              << "Downloads the named entries of <remote_dir> (all when none are given).\n"
              << "\n"
              << "Options:\n"
              << "  -o, --output <dir>   Local destination (default: current directory)\n"
              << "  -c, --cache <dir>    Fetch the first file into this cache directory only\n"
              << "  --help               Show this help message\n";
}

void print_listing(const explorer_state& explorer) {
    std::cout << explorer.wrkdir().string() << ":" << std::endl;
    for (const auto& entry : explorer.files()) {
        if (const auto* file = std::get_if<fs_file>(&entry)) {
            std::cout << "  " << file->name << "  " << format_bytes(file->size) << std::endl;
        } else {
            std::cout << "  " << get_name(entry) << "/" << std::endl;
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string output_dir = ".";
    std::optional<std::string> cache_dir;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-o" || arg == "--output") {
            if (++i >= argc) {
                std::cerr << "Error: --output requires an argument" << std::endl;
                return 1;
            }
            output_dir = argv[i];
        } else if (arg == "-c" || arg == "--cache") {
            if (++i >= argc) {
                std::cerr << "Error: --cache requires an argument" << std::endl;
                return 1;
            }
            cache_dir = argv[i];
        } else if (arg[0] != '-') {
            positional.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (positional.size() < 2) {
        print_usage(argv[0]);
        return 1;
    }

    get_logger().initialize();
    get_logger().set_console_output(false);

    session_controller::builder builder;
    builder.with_local_provider(std::make_unique<filesystem_local_provider>(output_dir))
        .with_remote_provider(std::make_unique<directory_remote_provider>(positional[0]));
    if (cache_dir) {
        builder.with_cache_dir(*cache_dir);
    }
    auto session_result = builder.build();
    if (!session_result) {
        std::cerr << "Failed to create session: " << session_result.error().message << std::endl;
        return 1;
    }
    auto& session = session_result.value();

    session.on_alert([](log_level, const std::string& message) {
        std::cerr << "[ALERT] " << message << std::endl;
    });

    if (auto connected = session.connect(); !connected) {
        std::cerr << "Could not connect: " << connected.error().message << std::endl;
        return 1;
    }
    if (auto changed = session.remote_changedir(positional[1], true); !changed) {
        return 1;
    }
    print_listing(session.remote_explorer());

    std::vector<fs_entry> selection;
    for (const auto& entry : session.remote_explorer().files()) {
        if (positional.size() == 2) {
            selection.push_back(entry);
            continue;
        }
        for (std::size_t i = 2; i < positional.size(); ++i) {
            if (get_name(entry) == positional[i]) {
                selection.push_back(entry);
            }
        }
    }

    int status = 0;
    if (cache_dir) {
        const fs_file* first = nullptr;
        for (const auto& entry : selection) {
            if ((first = std::get_if<fs_file>(&entry)) != nullptr) {
                break;
            }
        }
        if (first == nullptr) {
            std::cerr << "No file selected" << std::endl;
            status = 1;
        } else if (auto temp = session.download_file_as_temp(*first); temp) {
            std::cout << "Cached at " << temp.value().string() << std::endl;
        } else {
            std::cerr << temp.error().message << std::endl;
            status = 1;
        }
    } else {
        // Per-entry failures are reported through the alert listener
        if (auto received = session.recv_selection(selection); !received) {
            std::cerr << "Download failed: " << received.error().message << std::endl;
            status = 1;
        }
        std::cout << "Received " << format_bytes(session.engine().state().full.transferred())
                  << std::endl;
        print_listing(session.local_explorer());
    }

    if (auto back = session.go_to_previous_remote_dir(); !back) {
        std::cerr << back.error().message << std::endl;
    }
    session.disconnect();
    return status;
}
