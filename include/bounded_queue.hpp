#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace matchcast {

// ============================================================================
// Bounded Multi-Producer Ring Buffer with drop-oldest overflow
// Request threads push telemetry without ever blocking; when the ring is
// full the oldest element is overwritten and counted as dropped.
// ============================================================================

template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity)
        : buffer_(capacity > 0 ? capacity : 1), head_(0), size_(0),
          dropped_(0), in_flight_(0), closed_(false) {}

    // Disable copy/move
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // ========================================================================
    // Producer: Push (never blocks; returns false if the oldest was dropped)
    // ========================================================================
    bool push(T item) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (size_ == buffer_.size()) {
                // Overwrite the oldest slot
                head_ = increment(head_);
                --size_;
                ++dropped_;
                dropped = true;
            }
            buffer_[index(size_)] = std::move(item);
            ++size_;
        }
        not_empty_.notify_one();
        return !dropped;
    }

    // ========================================================================
    // Consumer: Pop (waits up to timeout; empty optional on timeout/close)
    // ========================================================================
    std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return size_ > 0 || closed_; });
        if (size_ == 0) {
            return std::nullopt;
        }
        T item = std::move(buffer_[head_]);
        head_ = increment(head_);
        --size_;
        ++in_flight_;
        return item;
    }

    // Consumer marks a popped item as fully handled
    void done() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (in_flight_ > 0) {
                --in_flight_;
            }
        }
        drained_.notify_all();
    }

    // Blocks until everything pushed so far has been popped and handled
    void wait_drained() {
        std::unique_lock<std::mutex> lock(mutex_);
        drained_.wait(lock, [this] { return size_ == 0 && in_flight_ == 0; });
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    // ========================================================================
    // Status queries
    // ========================================================================
    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    size_t capacity() const { return buffer_.size(); }

private:
    size_t increment(size_t idx) const {
        return (idx + 1) % buffer_.size();
    }

    size_t index(size_t offset) const {
        return (head_ + offset) % buffer_.size();
    }

    std::vector<T> buffer_;
    size_t head_;
    size_t size_;
    size_t dropped_;
    size_t in_flight_;
    bool closed_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable drained_;
};

} // namespace matchcast
