#pragma once

/**
 * @file worker.hpp
 * @brief Single isolated execution unit with drain-before-terminate shutdown
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>

#include "isoworker/core/channel.hpp"
#include "isoworker/core/computation.hpp"
#include "isoworker/core/logging.hpp"
#include "isoworker/core/message.hpp"
#include "isoworker/core/output_stream.hpp"

namespace isoworker {

/**
 * @brief Worker lifecycle state (monotonic)
 */
enum class WorkerState {
    Created,
    Started,
    Running,
    ShuttingDown,
    Terminated
};

[[nodiscard]] const char* to_string(WorkerState state) noexcept;

/**
 * @brief Count of deferred results still being forwarded
 *
 * Graceful shutdown waits for the count to reach zero; forced shutdown
 * cancels the wait and leaves the forwarders to finish on their own.
 */
class InFlight {
public:
    void acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        count_++;
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        count_--;
        changed_.notify_all();
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        changed_.notify_all();
    }

    /**
     * @brief Block until every forwarder has released, or until cancelled
     * @return false if the wait was cancelled
     */
    bool wait_drained() {
        std::unique_lock<std::mutex> lock(mutex_);
        changed_.wait(lock, [this] { return count_ == 0 || cancelled_; });
        return count_ == 0;
    }

private:
    std::mutex mutex_;
    std::condition_variable changed_;
    std::size_t count_{0};
    bool cancelled_{false};
};

/**
 * @brief Runs one function on its own thread, fed through channels
 *
 * The execution unit owns a private copy of the function and talks to the
 * owner only through three channels:
 * - input:   Data or Stop, FIFO, handed to the owner once at start-up
 * - output:  one Outcome per dispatched input
 * - control: carries nothing but the mirrored Stop
 *
 * Graceful shutdown queues Stop behind every pending input. When the unit
 * dequeues it, it waits for deferred results still in flight, mirrors Stop
 * on the control channel and the owner-side listener closes everything
 * down, so no queued input is lost. Forced shutdown closes the channels at
 * once and abandons queued work; deferred results still in flight finish
 * on detached forwarders and are rejected by the closed output.
 */
template<typename Input, typename Result>
class Worker {
public:
    using InputChannel = Channel<Message<Input>>;
    using OutputChannel = Channel<Outcome<Result>>;
    using ControlChannel = Channel<Stop>;

    explicit Worker(Computation<Input, Result> computation, std::string name = "worker")
        : computation_(std::move(computation))
        , name_(std::move(name))
        , output_(std::make_shared<OutputChannel>())
        , control_(std::make_shared<ControlChannel>())
        , in_flight_(std::make_shared<InFlight>())
        , stream_(output_) {}

    ~Worker() {
        force_shutdown();
        join();
    }

    // Non-copyable, non-movable
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

    /**
     * @brief Spawn the execution unit
     *
     * The returned future completes the start-up handshake when waited on;
     * it must be waited on before the first send().
     *
     * @throws std::runtime_error if the worker was already started
     */
    std::future<void> start() {
        auto expected = WorkerState::Created;
        if (!state_.compare_exchange_strong(expected, WorkerState::Started)) {
            throw std::runtime_error("Worker " + name_ + " already started");
        }

        std::promise<std::shared_ptr<InputChannel>> setup;
        handshake_ = setup.get_future();

        unit_ = std::thread(&Worker::run, computation_, output_, control_,
                            in_flight_, std::move(setup), name_);
        ISOWORKER_LOG_DEBUG(name_ + " spawned");

        return std::async(std::launch::deferred, [this] { complete_start(); });
    }

    /**
     * @brief Queue an input for the function
     *
     * Fire-and-forget. Inputs sent after shutdown() are ignored.
     */
    void send(Input input) {
        if (!input_) {
            ISOWORKER_LOG_WARN(name_ + ": send before start completed, input dropped");
            return;
        }
        if (!input_->push(Data<Input>{std::move(input)})) {
            ISOWORKER_LOG_TRACE(name_ + ": input ignored after shutdown");
        }
    }

    /**
     * @brief Queue every element of @p inputs, in iteration order
     */
    template<typename Range>
    void send_all(const Range& inputs) {
        for (const auto& input : inputs) {
            send(input);
        }
    }

    /**
     * @brief Terminate once every input queued so far has been dispatched
     *
     * Queues Stop behind pending inputs; later calls are no-ops.
     */
    void shutdown() {
        if (!input_) {
            ISOWORKER_LOG_WARN(name_ + ": shutdown before start completed, ignored");
            return;
        }

        auto expected = WorkerState::Running;
        if (!state_.compare_exchange_strong(expected, WorkerState::ShuttingDown)) {
            ISOWORKER_LOG_DEBUG(name_ + ": shutdown ignored in state " + to_string(expected));
            return;
        }

        ISOWORKER_LOG_DEBUG(name_ + ": shutdown requested");
        input_->push(Stop{});
    }

    /**
     * @brief Terminate immediately, abandoning queued and in-flight work
     *
     * Safe at any point of the lifecycle and safe to repeat. Deferred
     * results still pending are not waited for.
     */
    void force_shutdown() noexcept {
        if (!input_ && handshake_.valid()) {
            // Started but never awaited: collect the input handle so the
            // unit can be released
            try {
                input_ = handshake_.get();
            } catch (const std::exception& e) {
                ISOWORKER_LOG_ERROR(name_ + ": handshake failed: " + e.what());
            }
        }

        if (state_.exchange(WorkerState::Terminated) != WorkerState::Terminated) {
            ISOWORKER_LOG_DEBUG(name_ + ": forced shutdown");
        }
        close_channels();
        in_flight_->cancel();
    }

    /**
     * @brief Wait for the execution unit and the listener to exit
     *
     * Blocks until the worker terminates; call after shutdown() or
     * force_shutdown(). After force_shutdown() this waits only for the
     * call the unit is running, if any.
     */
    void join() {
        if (listener_.joinable()) {
            listener_.join();
        }
        if (unit_.joinable()) {
            unit_.join();
        }
    }

    [[nodiscard]] OutputStream<Result>& output_stream() noexcept { return stream_; }

    [[nodiscard]] WorkerState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] ChannelStats input_stats() const {
        return input_ ? input_->stats() : ChannelStats{};
    }

    [[nodiscard]] ChannelStats output_stats() const { return output_->stats(); }

private:
    // Runs on the owner when start()'s future is waited on
    void complete_start() {
        if (!handshake_.valid()) {
            return;  // force_shutdown() already collected the handshake
        }
        input_ = handshake_.get();
        listener_ = std::thread(&Worker::listen, this);

        auto expected = WorkerState::Started;
        if (state_.compare_exchange_strong(expected, WorkerState::Running)) {
            ISOWORKER_LOG_DEBUG(name_ + " running");
        }
    }

    // Owner-side listener: the only graceful path to Terminated
    void listen() {
        set_thread_name(name_ + "/control");

        if (!control_->pop()) {
            return;  // closed by force_shutdown()
        }

        ISOWORKER_LOG_DEBUG(name_ + ": stop mirrored, terminating");
        close_channels();
        state_.store(WorkerState::Terminated, std::memory_order_release);
    }

    void close_channels() noexcept {
        output_->close();
        if (input_) {
            input_->close();
        }
        control_->close();
    }

    // Body of the execution unit. Takes everything by value: the unit
    // shares nothing with the owner but the channels and the in-flight count.
    static void run(Computation<Input, Result> computation,
                    std::shared_ptr<OutputChannel> output,
                    std::shared_ptr<ControlChannel> control,
                    std::shared_ptr<InFlight> in_flight,
                    std::promise<std::shared_ptr<InputChannel>> setup,
                    std::string name) {
        set_thread_name(name);

        auto input = std::make_shared<InputChannel>();
        setup.set_value(input);

        bool stopped = false;

        while (auto message = input->pop()) {
            if (std::holds_alternative<Stop>(*message)) {
                stopped = true;
                break;
            }
            if (output->is_closed()) {
                break;
            }
            dispatch(computation, std::get<Data<Input>>(std::move(*message)).value,
                     output, in_flight, name);
        }

        input->close();

        // Deferred results still in flight belong to inputs queued before
        // Stop; wait for them before reporting the drain
        if (stopped) {
            if (in_flight->wait_drained()) {
                control->push(Stop{});
            } else {
                ISOWORKER_LOG_DEBUG(name + ": drain cancelled by forced shutdown");
            }
        }
        ISOWORKER_LOG_DEBUG(name + ": execution unit exiting");
    }

    static void dispatch(const Computation<Input, Result>& computation,
                         Input input,
                         const std::shared_ptr<OutputChannel>& output,
                         const std::shared_ptr<InFlight>& in_flight,
                         const std::string& name) {
        try {
            auto completion = computation(std::move(input));

            if (auto* ready = std::get_if<0>(&completion)) {
                output->push(Outcome<Result>(std::move(*ready)));
                return;
            }

            // Detached: a forced shutdown must not wait for the result
            in_flight->acquire();
            try {
                std::thread([output, in_flight, name,
                             deferred = std::get<1>(std::move(completion))]() mutable {
                    forward_deferred(std::move(deferred), *output, name);
                    in_flight->release();
                }).detach();
            } catch (...) {
                in_flight->release();
                throw;
            }
        } catch (const std::exception& e) {
            ISOWORKER_LOG_WARN(name + ": function threw: " + e.what());
            output->push(Outcome<Result>::failure(std::current_exception()));
        } catch (...) {
            ISOWORKER_LOG_WARN(name + ": function threw a non-standard exception");
            output->push(Outcome<Result>::failure(std::current_exception()));
        }
    }

    static void forward_deferred(Deferred<Result> deferred,
                                 OutputChannel& output,
                                 const std::string& name) noexcept {
        try {
            output.push(Outcome<Result>(deferred.get()));
        } catch (const std::exception& e) {
            ISOWORKER_LOG_WARN(name + ": deferred result failed: " + e.what());
            output.push(Outcome<Result>::failure(std::current_exception()));
        } catch (...) {
            ISOWORKER_LOG_WARN(name + ": deferred result failed");
            output.push(Outcome<Result>::failure(std::current_exception()));
        }
    }

    Computation<Input, Result> computation_;
    std::string name_;

    std::shared_ptr<InputChannel> input_;
    std::shared_ptr<OutputChannel> output_;
    std::shared_ptr<ControlChannel> control_;
    std::shared_ptr<InFlight> in_flight_;
    OutputStream<Result> stream_;

    std::future<std::shared_ptr<InputChannel>> handshake_;
    std::thread unit_;
    std::thread listener_;
    std::atomic<WorkerState> state_{WorkerState::Created};
};

} // namespace isoworker
