// Copyright 2026 The wamcp Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace wamcp::bridge {

/**
 * @brief Bounded multi-producer channel of output lines.
 *
 * Ring buffer guarded by a mutex. When full, push() overwrites the oldest entry so producers
 * never block; the number of overwritten lines is reported by dropped().
 */
class LineChannel {
public:
    // Capacity must be > 0.
    explicit LineChannel(std::size_t capacity)
        : buf_(capacity ? capacity + 1 : 2), cap_(capacity ? capacity + 1 : 2) {}

    void push(std::string line) {
        std::lock_guard<std::mutex> lk(mu_);
        auto next = inc(head_);
        if (next == tail_) {
            tail_ = inc(tail_); // full: drop oldest
            ++dropped_;
        }
        buf_[head_] = std::move(line);
        head_ = next;
    }

    bool try_pop(std::string& out) {
        std::lock_guard<std::mutex> lk(mu_);
        if (tail_ == head_)
            return false; // empty
        out = std::move(buf_[tail_]);
        tail_ = inc(tail_);
        return true;
    }

    /// Pop everything currently queued.
    std::vector<std::string> drain() {
        std::vector<std::string> out;
        std::lock_guard<std::mutex> lk(mu_);
        while (tail_ != head_) {
            out.push_back(std::move(buf_[tail_]));
            tail_ = inc(tail_);
        }
        return out;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lk(mu_);
        return head_ == tail_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return (head_ + cap_ - tail_) % cap_;
    }

    std::size_t capacity() const { return cap_ - 1; }

    std::size_t dropped() const {
        std::lock_guard<std::mutex> lk(mu_);
        return dropped_;
    }

private:
    std::size_t inc(std::size_t i) const { return (i + 1) % cap_; }

    std::vector<std::string> buf_;
    std::size_t cap_;
    std::size_t head_ = 0;
    std::size_t tail_ = 0;
    std::size_t dropped_ = 0;
    mutable std::mutex mu_;
};

} // namespace wamcp::bridge
