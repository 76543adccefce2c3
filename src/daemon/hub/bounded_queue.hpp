#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// Fixed-capacity multi-producer queue with a non-blocking push and a
// closable, timed pop. Once closed, pushes fail and pops drain what is left
// before reporting Closed.
template <typename T>
class BoundedQueue {
public:
    enum class PopStatus { Item, Timeout, Closed };

    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Returns false when full or closed; never blocks.
    bool try_push(T item) {
        {
            std::lock_guard lock(mu_);
            if (closed_ || items_.size() >= capacity_) return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    PopStatus pop_for(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mu_);
        if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; })) {
            return PopStatus::Timeout;
        }
        if (items_.empty()) return PopStatus::Closed;
        out = std::move(items_.front());
        items_.pop_front();
        return PopStatus::Item;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mu_);
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void close() {
        {
            std::lock_guard lock(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard lock(mu_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard lock(mu_);
        return items_.size();
    }

    bool full() const {
        std::lock_guard lock(mu_);
        return items_.size() >= capacity_;
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};
