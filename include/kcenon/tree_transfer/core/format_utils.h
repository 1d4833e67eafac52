/**
 * @file format_utils.h
 * @brief Human readable sizes, rates and durations for log messages
 */

#ifndef KCENON_TREE_TRANSFER_CORE_FORMAT_UTILS_H
#define KCENON_TREE_TRANSFER_CORE_FORMAT_UTILS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace kcenon::tree_transfer {

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;
}  // namespace sizes

/**
 * @brief Format bytes, e.g. "1.50 MB"
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Format a rate, e.g. "500.00 MB/s"
 */
[[nodiscard]] auto format_throughput(double bytes_per_second) -> std::string;

/**
 * @brief Format a duration in seconds with millisecond precision, e.g. "1.250"
 */
[[nodiscard]] auto format_seconds(std::chrono::milliseconds duration) -> std::string;

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_CORE_FORMAT_UTILS_H
