#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace ds::concurrency {

// Bounded hand-off between producers that must never block and a consumer that
// waits. Pushing onto a full (or zero-capacity) queue drops the item; callers
// treat every item as a best-effort hint.
template <typename T>
class WakeQueue {
public:
    explicit WakeQueue(const size_t capacity) : capacity_(capacity) {}

    WakeQueue(const WakeQueue&) = delete;
    WakeQueue& operator=(const WakeQueue&) = delete;

    // Returns false when the item was dropped.
    [[nodiscard]] bool tryPush(T item) {
        {
            std::scoped_lock lock(mutex_);
            if (closed_ || queue_.size() >= capacity_) return false;
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until an item arrives, the timeout elapses or the queue is closed.
    template <typename Rep, typename Period>
    std::optional<T> popFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) return std::nullopt;
        if (queue_.empty()) return std::nullopt;
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::optional<T> tryPop() {
        std::scoped_lock lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    // Wakes every waiting consumer; later pushes are dropped.
    void close() {
        {
            std::scoped_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] size_t size() const {
        std::scoped_lock lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] bool isClosed() const {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

private:
    const size_t capacity_;
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

}
