#pragma once

/**
 * @file channel.hpp
 * @brief Unbounded, thread-safe FIFO channel with close semantics
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace isoworker {

/**
 * @brief Channel statistics for monitoring
 */
struct ChannelStats {
    std::uint64_t push_count{0};
    std::uint64_t pop_count{0};
    std::uint64_t rejected_count{0};
    std::uint64_t pop_blocked_count{0};
    std::size_t current_size{0};
    std::size_t high_watermark{0};
};

/**
 * @brief Unbounded MPMC (Multi-Producer Multi-Consumer) channel
 *
 * The only object shared between an owner and an execution unit. Pushes
 * never block; a closed channel rejects pushes but still hands out the
 * items queued before closure, so a consumer always drains it fully.
 *
 * @tparam T Item type
 */
template<typename T>
class Channel {
public:
    Channel() = default;

    // Non-copyable, non-movable (due to synchronization primitives)
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel&&) = delete;

    /**
     * @brief Push an item to the back of the channel
     * @param item Item to push
     * @return true if pushed, false if the channel is closed
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (closed_) {
                stats_.rejected_count++;
                return false;
            }

            stats_.push_count++;
            buffer_.push_back(std::move(item));

            if (buffer_.size() > stats_.high_watermark) {
                stats_.high_watermark = buffer_.size();
            }
            stats_.current_size = buffer_.size();
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop the front item, blocking while empty
     * @return Item if available, nullopt if the channel is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);

        while (buffer_.empty() && !closed_) {
            stats_.pop_blocked_count++;
            not_empty_.wait(lock);
        }

        return take_front();
    }

    /**
     * @brief Try to pop without blocking
     * @return Item if available, nullopt if empty
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_front();
    }

    /**
     * @brief Pop with timeout
     * @param timeout Maximum wait duration
     * @return Item if available, nullopt on timeout or when closed and empty
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!not_empty_.wait_for(lock, timeout, [this] {
            return !buffer_.empty() || closed_;
        })) {
            stats_.pop_blocked_count++;
            return std::nullopt;
        }

        return take_front();
    }

    /**
     * @brief Close the channel (no more pushes accepted)
     *
     * Idempotent; wakes every blocked consumer.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * @brief Check if the channel is closed and fully drained
     */
    [[nodiscard]] bool is_done() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && buffer_.empty();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.size();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.empty();
    }

    [[nodiscard]] ChannelStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    // Caller holds mutex_
    std::optional<T> take_front() {
        if (buffer_.empty()) {
            return std::nullopt;
        }

        stats_.pop_count++;
        T item = std::move(buffer_.front());
        buffer_.pop_front();
        stats_.current_size = buffer_.size();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;

    std::deque<T> buffer_;
    bool closed_{false};

    ChannelStats stats_;
};

} // namespace isoworker
