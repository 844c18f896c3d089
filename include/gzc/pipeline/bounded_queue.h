// =============================================================================
// gzchunk - Bounded Hand-off Queue and Ordering Barrier
// =============================================================================
// Synchronisation primitives connecting the pipeline stages.
//
// - BoundedQueue<T>: FIFO with a capacity limit. enqueue() blocks while the
//   queue is full, dequeue() blocks while it is empty. Each instance owns its
//   own mutex and condition variables, so unrelated runs never contend.
// - OrderingBarrier: per-stage "next expected sequence number". wait(n)
//   blocks until n is the next expected value, advance() releases the next
//   waiter. A no-op with one FIFO consumer, it keeps output in read order
//   if several workers ever drain the same queue.
// =============================================================================

#ifndef GZC_PIPELINE_BOUNDED_QUEUE_H
#define GZC_PIPELINE_BOUNDED_QUEUE_H

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "gzc/common/types.h"

namespace gzc::pipeline {

// =============================================================================
// Bounded Queue
// =============================================================================

/// @brief Thread-safe FIFO with blocking enqueue/dequeue and a capacity limit
/// @tparam T Item type (moved in and out)
template <typename T>
class BoundedQueue {
public:
    /// @brief Construct with capacity
    /// @param capacity Maximum number of queued items (0 is treated as 1)
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(std::max<std::size_t>(capacity, 1)) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;

    /// @brief Append an item, waiting while the queue is at capacity
    void enqueue(T item) {
        {
            std::unique_lock lock(mutex_);
            notFull_.wait(lock, [this] { return items_.size() < capacity_; });
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
    }

    /// @brief Remove and return the head, waiting while the queue is empty
    [[nodiscard]] T dequeue() {
        T item;
        {
            std::unique_lock lock(mutex_);
            notEmpty_.wait(lock, [this] { return !items_.empty(); });
            item = std::move(items_.front());
            items_.pop_front();
        }
        notFull_.notify_one();
        return item;
    }

    /// @brief Remove and return the head if one is available
    [[nodiscard]] std::optional<T> tryDequeue() {
        std::optional<T> item;
        {
            std::lock_guard lock(mutex_);
            if (items_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        notFull_.notify_one();
        return item;
    }

    /// @brief Get number of queued items
    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    /// @brief Check if the queue is empty
    [[nodiscard]] bool empty() const {
        std::lock_guard lock(mutex_);
        return items_.empty();
    }

    /// @brief Get capacity
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notFull_;
    std::condition_variable notEmpty_;
    std::deque<T> items_;
};

// =============================================================================
// Ordering Barrier
// =============================================================================

/// @brief Gate that admits sequence numbers strictly in order
class OrderingBarrier {
public:
    /// @brief Construct with the first expected sequence number
    explicit OrderingBarrier(SequenceNumber start = 0) : next_(start) {}

    OrderingBarrier(const OrderingBarrier&) = delete;
    OrderingBarrier& operator=(const OrderingBarrier&) = delete;

    /// @brief Block until seq is the next expected sequence number
    void wait(SequenceNumber seq);

    /// @brief Mark the current sequence number done and admit the next
    void advance();

    /// @brief Get the next expected sequence number
    [[nodiscard]] SequenceNumber next() const;

    /// @brief Reset the expected sequence number (only between runs)
    void reset(SequenceNumber start = 0);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SequenceNumber next_;
};

}  // namespace gzc::pipeline

#endif  // GZC_PIPELINE_BOUNDED_QUEUE_H
