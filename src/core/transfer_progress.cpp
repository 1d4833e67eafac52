/**
 * @file transfer_progress.cpp
 * @brief Progress counter implementation
 */

#include "kcenon/tree_transfer/core/transfer_progress.h"

#include <algorithm>
#include <cmath>

namespace kcenon::tree_transfer {

transfer_progress::transfer_progress()
    : started_(std::chrono::steady_clock::now()) {}

void transfer_progress::init(uint64_t total_bytes) {
    started_ = std::chrono::steady_clock::now();
    total_ = total_bytes;
    transferred_ = 0;
}

void transfer_progress::update_progress(uint64_t delta) {
    transferred_ += delta;
}

auto transfer_progress::calc_progress() const -> double {
    if (total_ == 0) {
        return 1.0;
    }
    auto ratio = static_cast<double>(transferred_) / static_cast<double>(total_);
    return std::clamp(ratio, 0.0, 1.0);
}

auto transfer_progress::calc_percentage() const -> unsigned {
    return static_cast<unsigned>(std::lround(calc_progress() * 100.0));
}

auto transfer_progress::calc_bytes_per_second() const -> uint64_t {
    auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started_).count();
    auto elapsed_secs = std::max(static_cast<double>(elapsed_us) / 1'000'000.0, 0.001);
    return static_cast<uint64_t>(static_cast<double>(transferred_) / elapsed_secs);
}

auto transfer_progress::elapsed() const -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
}

void transfer_state::reset() {
    full.init(0);
    partial.init(0);
    aborted_.store(false, std::memory_order_release);
}

}  // namespace kcenon::tree_transfer
