#pragma once

/**
 * @file queue.hpp
 * @brief Bounded, thread-safe queue with backpressure support
 */

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace esflow {

/**
 * @brief Queue statistics for monitoring
 */
struct QueueStats {
    std::uint64_t push_count{0};
    std::uint64_t pop_count{0};
    std::uint64_t push_blocked_count{0};
    std::uint64_t pop_blocked_count{0};
    std::size_t current_size{0};
    std::size_t capacity{0};
    std::size_t high_watermark{0};
};

/**
 * @brief Bounded MPMC ring buffer
 *
 * Producers block while the buffer is full, which is how the task pool
 * pushes back on publishers that outrun the workers.
 *
 * @tparam T Element type (default-constructible, movable)
 * @tparam Capacity Static queue capacity (must be power of 2)
 */
template<typename T, std::size_t Capacity = 1024>
class BoundedQueue {
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");
    static_assert(Capacity > 0, "Capacity must be positive");

public:
    BoundedQueue() = default;

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;

    /**
     * @brief Push an item, blocking while full
     * @return false if the queue is closed
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        stats_.push_count++;

        while (size_ == Capacity && !closed_) {
            stats_.push_blocked_count++;
            not_full_.wait(lock);
        }
        if (closed_) {
            return false;
        }

        emplace_locked(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push without blocking
     * @return false if full or closed
     */
    bool try_push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_ == Capacity || closed_) {
            return false;
        }
        stats_.push_count++;
        emplace_locked(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push with timeout
     * @return false on timeout or if closed
     */
    template<typename Rep, typename Period>
    bool push_for(T item, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        stats_.push_count++;

        if (!not_full_.wait_for(lock, timeout, [this] {
            return size_ < Capacity || closed_;
        })) {
            stats_.push_blocked_count++;
            return false;
        }
        if (closed_) {
            return false;
        }

        emplace_locked(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop an item, blocking while empty
     * @return nullopt once the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        stats_.pop_count++;

        while (size_ == 0 && !closed_) {
            stats_.pop_blocked_count++;
            not_empty_.wait(lock);
        }
        if (size_ == 0) {
            return std::nullopt;
        }

        T item = take_locked();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Pop without blocking
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size_ == 0) {
            return std::nullopt;
        }
        stats_.pop_count++;
        T item = take_locked();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Pop with timeout
     * @return nullopt on timeout or once closed and drained
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        stats_.pop_count++;

        if (!not_empty_.wait_for(lock, timeout, [this] {
            return size_ > 0 || closed_;
        })) {
            stats_.pop_blocked_count++;
            return std::nullopt;
        }
        if (size_ == 0) {
            return std::nullopt;
        }

        T item = take_locked();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Stop accepting pushes; pending items can still be popped
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_ == 0;
    }

    [[nodiscard]] bool full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_ == Capacity;
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept {
        return Capacity;
    }

    [[nodiscard]] QueueStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = stats_;
        s.capacity = Capacity;
        return s;
    }

private:
    void emplace_locked(T item) {
        buffer_[tail_] = std::move(item);
        tail_ = (tail_ + 1) & (Capacity - 1);
        size_++;
        if (size_ > stats_.high_watermark) {
            stats_.high_watermark = size_;
        }
        stats_.current_size = size_;
    }

    T take_locked() {
        T item = std::move(buffer_[head_]);
        buffer_[head_] = T{};
        head_ = (head_ + 1) & (Capacity - 1);
        size_--;
        stats_.current_size = size_;
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;

    std::array<T, Capacity> buffer_{};
    std::size_t head_{0};
    std::size_t tail_{0};
    std::size_t size_{0};
    bool closed_{false};

    QueueStats stats_;
};

} // namespace esflow
