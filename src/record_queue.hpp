#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace logtap {

// Bounded FIFO between one producer side (tailer threads) and one
// consumer (a delivery loop). Pushing never blocks: when full, the oldest
// pending item is discarded. Survivors keep their relative order.
template<typename T>
class RecordQueue {
public:
    explicit RecordQueue(size_t capacity = 1000)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    RecordQueue(const RecordQueue&) = delete;
    RecordQueue& operator=(const RecordQueue&) = delete;

    // Returns false if the queue is closed and the item was not accepted.
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            if (items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_;
            }
            items_.push_back(std::move(item));
            ++pushed_;
        }
        cv_.notify_one();
        return true;
    }

    // Waits up to `timeout` for an item. Empty on timeout or once closed.
    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        if (closed_ || items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Discards pending items and wakes any waiter.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            items_.clear();
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    uint64_t pushed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pushed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    size_t capacity_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
    uint64_t pushed_ = 0;
};

} // namespace logtap
