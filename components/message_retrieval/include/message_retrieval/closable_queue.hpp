#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace message_retrieval {

// Unbounded FIFO handoff between one or more producers and a single consumer.
// push never blocks; pop blocks until an item arrives or the queue is closed
// and drained.
template<typename T>
class ClosableQueue {
public:
    ClosableQueue() = default;

    ClosableQueue(const ClosableQueue&) = delete;
    ClosableQueue& operator=(const ClosableQueue&) = delete;

    // Returns false once the queue is closed
    bool push(T item) {
        return pushIf(std::move(item), [] { return true; });
    }

    // Enqueues only if the queue is open and admit() returns true. admit runs
    // under the queue lock, so it is serialized with close() and other pushes.
    template<typename Admit>
    bool pushIf(T&& item, Admit&& admit) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                ++stats_.rejectedAfterClose;
                return false;
            }
            if (!admit()) {
                return false;
            }

            items_.push_back(std::move(item));
            ++stats_.totalEnqueued;
            if (items_.size() > stats_.peakSize) {
                stats_.peakSize = items_.size();
            }
        }
        available_.notify_one();
        return true;
    }

    // Blocks until an item is available; nullopt once closed and empty
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait(lock, [this] { return !items_.empty() || closed_; });
        return takeFront();
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return takeFront();
    }

    // Idempotent. Items already queued stay available to pop().
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        available_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool isEmpty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    // Statistics
    struct Stats {
        size_t totalEnqueued = 0;
        size_t totalDequeued = 0;
        size_t rejectedAfterClose = 0;
        size_t peakSize = 0;
    };

    Stats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<T> items_;
    bool closed_ = false;
    Stats stats_;

    std::optional<T> takeFront() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        ++stats_.totalDequeued;
        return item;
    }
};

} // namespace message_retrieval
