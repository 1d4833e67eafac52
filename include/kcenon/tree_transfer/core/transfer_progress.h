/**
 * @file transfer_progress.h
 * @brief Byte counters for one transfer scope and the engine transfer state
 *
 * A transfer_state carries two counters: @c full covers the whole payload
 * and @c partial covers the file currently being copied. Both share the
 * same semantics.
 *
 * @code
 * transfer_progress progress;
 * progress.init(total_bytes);
 *
 * // During the copy loop
 * progress.update_progress(chunk_size);
 *
 * auto ratio = progress.calc_progress();
 * auto rate = progress.calc_bytes_per_second();
 * @endcode
 */

#ifndef KCENON_TREE_TRANSFER_CORE_TRANSFER_PROGRESS_H
#define KCENON_TREE_TRANSFER_CORE_TRANSFER_PROGRESS_H

#include <atomic>
#include <chrono>
#include <cstdint>

namespace kcenon::tree_transfer {

using time_point = std::chrono::steady_clock::time_point;

/**
 * @brief Progress counter for a transfer scope
 *
 * Not thread-safe; owned and driven by the thread running the transfer.
 */
class transfer_progress {
public:
    transfer_progress();

    /**
     * @brief Reset the counter for a new scope
     * @param total_bytes Expected number of bytes (0 is allowed)
     */
    void init(uint64_t total_bytes);

    /**
     * @brief Add transferred bytes
     *
     * The counter is not clamped to the total; a source that grew after it
     * was sized may exceed it. calc_progress() clamps the ratio.
     */
    void update_progress(uint64_t delta);

    /**
     * @brief Ratio of transferred to total bytes
     * @return Value in [0.0, 1.0]; 1.0 when the total is 0
     */
    [[nodiscard]] auto calc_progress() const -> double;

    /**
     * @brief Ratio as a rounded percentage (0..100)
     */
    [[nodiscard]] auto calc_percentage() const -> unsigned;

    /**
     * @brief Average throughput since init
     *
     * Elapsed time is floored at one millisecond.
     */
    [[nodiscard]] auto calc_bytes_per_second() const -> uint64_t;

    [[nodiscard]] auto started() const -> time_point { return started_; }
    [[nodiscard]] auto total() const -> uint64_t { return total_; }
    [[nodiscard]] auto transferred() const -> uint64_t { return transferred_; }
    [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds;

private:
    time_point started_;
    uint64_t total_ = 0;
    uint64_t transferred_ = 0;
};

/**
 * @brief Dual-level progress plus the cooperative abort flag
 *
 * The abort flag may be raised from any thread; the transfer thread polls
 * it between chunks. It stays raised until reset().
 */
class transfer_state {
public:
    transfer_state() = default;

    transfer_state(const transfer_state&) = delete;
    auto operator=(const transfer_state&) -> transfer_state& = delete;

    /**
     * @brief Clear counters and the abort flag
     */
    void reset();

    void abort() noexcept { aborted_.store(true, std::memory_order_release); }

    [[nodiscard]] auto aborted() const noexcept -> bool {
        return aborted_.load(std::memory_order_acquire);
    }

    transfer_progress full;
    transfer_progress partial;

private:
    std::atomic<bool> aborted_{false};
};

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_CORE_TRANSFER_PROGRESS_H
