#pragma once

/**
 * @file output_stream.hpp
 * @brief Consumer-facing asynchronous sequence of results
 */

#include <chrono>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>

#include "isoworker/core/channel.hpp"
#include "isoworker/core/message.hpp"

namespace isoworker {

/**
 * @brief Single-subscription stream of results read from an output channel
 *
 * Open-ended while its producer runs; finite once the producer shuts down
 * (gracefully or forcibly). Items queued before closure are still
 * delivered. Failed outcomes rethrow their exception from next().
 */
template<typename Result>
class OutputStream {
public:
    using OutcomeChannel = Channel<Outcome<Result>>;

    explicit OutputStream(std::shared_ptr<OutcomeChannel> channel)
        : channel_(std::move(channel)) {}

    OutputStream(const OutputStream&) = delete;
    OutputStream& operator=(const OutputStream&) = delete;

    /**
     * @brief Wait for the next result
     * @return Result, or nullopt once the stream is closed and drained
     * @throws whatever the function threw for this item
     */
    std::optional<Result> next() {
        auto outcome = channel_->pop();
        if (!outcome) {
            return std::nullopt;
        }
        return outcome->take();
    }

    /**
     * @brief Wait for the next result for at most @p timeout
     * @return Result, or nullopt on timeout or once closed and drained
     */
    template<typename Rep, typename Period>
    std::optional<Result> next_for(std::chrono::duration<Rep, Period> timeout) {
        auto outcome = channel_->pop_for(timeout);
        if (!outcome) {
            return std::nullopt;
        }
        return outcome->take();
    }

    /**
     * @brief Wait for the next outcome without rethrowing failures
     */
    std::optional<Outcome<Result>> next_outcome() {
        return channel_->pop();
    }

    /**
     * @brief Check if the producer has closed the stream
     */
    [[nodiscard]] bool is_closed() const { return channel_->is_closed(); }

    /**
     * @brief Check if the stream is closed and every item consumed
     */
    [[nodiscard]] bool is_done() const { return channel_->is_done(); }

    /**
     * @brief Number of results waiting to be consumed
     */
    [[nodiscard]] std::size_t pending() const { return channel_->size(); }

    [[nodiscard]] ChannelStats stats() const { return channel_->stats(); }

    /**
     * @brief Input iterator over results; ends when the stream closes
     */
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Result;
        using difference_type = std::ptrdiff_t;
        using pointer = Result*;
        using reference = Result&;

        iterator() = default;

        explicit iterator(OutputStream* stream)
            : stream_(stream) {
            advance();
        }

        reference operator*() { return *current_; }
        pointer operator->() { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        friend bool operator==(const iterator& a, const iterator& b) noexcept {
            return a.stream_ == b.stream_;
        }

        friend bool operator!=(const iterator& a, const iterator& b) noexcept {
            return !(a == b);
        }

    private:
        void advance() {
            current_ = stream_->next();
            if (!current_) {
                stream_ = nullptr;
            }
        }

        OutputStream* stream_{nullptr};
        std::optional<Result> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::shared_ptr<OutcomeChannel> channel_;
};

} // namespace isoworker
