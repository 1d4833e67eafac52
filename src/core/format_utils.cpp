/**
 * @file format_utils.cpp
 */

#include "kcenon/tree_transfer/core/format_utils.h"

#include <iomanip>
#include <sstream>

namespace kcenon::tree_transfer {

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::GB) {
        oss << static_cast<double>(bytes) / sizes::GB << " GB";
    } else if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

auto format_throughput(double bytes_per_second) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes_per_second >= sizes::GB) {
        oss << bytes_per_second / sizes::GB << " GB/s";
    } else if (bytes_per_second >= sizes::MB) {
        oss << bytes_per_second / sizes::MB << " MB/s";
    } else if (bytes_per_second >= sizes::KB) {
        oss << bytes_per_second / sizes::KB << " KB/s";
    } else {
        oss << bytes_per_second << " B/s";
    }

    return oss.str();
}

auto format_seconds(std::chrono::milliseconds duration) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << static_cast<double>(duration.count()) / 1000.0;
    return oss.str();
}

}  // namespace kcenon::tree_transfer
