// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <vector>

/*
 * Fan-in point for a known number of concurrent producers. Producers push exactly one item each;
 * the consumer waits until every expected item arrived or a deadline passed, whichever comes
 * first. Draining seals the funnel, so an item pushed afterwards is discarded instead of being
 * lost halfway or reported twice.
 *
 * Producers that may outlive the consumer must hold the funnel through a std::shared_ptr.
 */
template <typename T>
class ResultFunnel {
public:
    explicit ResultFunnel(size_t expected) : expected_(expected) { items_.reserve(expected); }

    ResultFunnel(const ResultFunnel&) = delete;
    ResultFunnel& operator=(const ResultFunnel&) = delete;

    // Returns false when the funnel is already sealed and `item` was dropped.
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (sealed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_all();
        return true;
    }

    std::vector<T> drain_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return items_.size() >= expected_; });
        sealed_ = true;
        std::vector<T> drained = std::move(items_);
        items_.clear();
        return drained;
    }

    size_t expected() const { return expected_; }

    size_t outstanding() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size() >= expected_ ? 0 : expected_ - items_.size();
    }

    bool sealed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sealed_;
    }

private:
    const size_t expected_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<T> items_;
    bool sealed_ = false;
};
