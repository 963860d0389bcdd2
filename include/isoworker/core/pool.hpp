#pragma once

/**
 * @file pool.hpp
 * @brief Fixed pool of workers with round-robin dispatch and merged output
 */

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "isoworker/core/channel.hpp"
#include "isoworker/core/computation.hpp"
#include "isoworker/core/logging.hpp"
#include "isoworker/core/output_stream.hpp"
#include "isoworker/core/worker.hpp"

namespace isoworker {

/**
 * @brief Configuration for a worker pool
 */
struct PoolConfig {
    std::size_t worker_count{8};
    std::string name{"pool"};
};

/**
 * @brief Runs one function on a fixed set of workers
 *
 * Input i goes to worker i mod worker_count(). Every worker's outcomes are
 * forwarded into a single merged stream in completion order; the merged
 * stream closes once every worker's stream has closed.
 */
template<typename Input, typename Result>
class Pool {
public:
    using WorkerType = Worker<Input, Result>;

    static constexpr std::size_t kDefaultWorkerCount = 8;

    explicit Pool(Computation<Input, Result> computation,
                  std::size_t worker_count = kDefaultWorkerCount)
        : Pool(std::move(computation), PoolConfig{worker_count, "pool"}) {}

    /**
     * @throws std::invalid_argument if config.worker_count is zero
     */
    Pool(Computation<Input, Result> computation, PoolConfig config)
        : config_(std::move(config))
        , merged_(std::make_shared<Channel<Outcome<Result>>>())
        , stream_(merged_) {
        if (config_.worker_count == 0) {
            throw std::invalid_argument("Pool " + config_.name + " needs at least one worker");
        }

        workers_.reserve(config_.worker_count);
        for (std::size_t i = 0; i < config_.worker_count; i++) {
            workers_.push_back(std::make_unique<WorkerType>(
                computation, config_.name + "/worker-" + std::to_string(i)));
        }

        open_streams_.store(workers_.size());
        forwarders_.reserve(workers_.size());
        for (auto& worker : workers_) {
            forwarders_.emplace_back(&Pool::forward, this, worker.get());
        }

        ISOWORKER_LOG_DEBUG(config_.name + " created with " +
                            std::to_string(workers_.size()) + " workers");
    }

    ~Pool() {
        force_shutdown();
        for (auto& forwarder : forwarders_) {
            if (forwarder.joinable()) {
                forwarder.join();
            }
        }
    }

    // Non-copyable, non-movable
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    /**
     * @brief Start every worker, one after another
     *
     * Each worker's handshake completes before the next one starts. The
     * returned future must be waited on before the first send().
     *
     * @throws std::runtime_error if the pool was already started
     */
    std::future<void> start() {
        if (started_.exchange(true)) {
            throw std::runtime_error("Pool " + config_.name + " already started");
        }

        return std::async(std::launch::deferred, [this] {
            for (auto& worker : workers_) {
                worker->start().get();
            }
            ISOWORKER_LOG_INFO(config_.name + " started " +
                               std::to_string(workers_.size()) + " workers");
        });
    }

    /**
     * @brief Route an input to the next worker in round-robin order
     */
    void send(Input input) {
        WorkerType* target = nullptr;
        {
            std::lock_guard<std::mutex> lock(cursor_mutex_);
            target = workers_[cursor_].get();
            cursor_ = (cursor_ + 1) % workers_.size();
        }
        target->send(std::move(input));
    }

    template<typename Range>
    void send_all(const Range& inputs) {
        for (const auto& input : inputs) {
            send(input);
        }
    }

    /**
     * @brief Gracefully shut down every worker
     *
     * Each worker drains its own queue and terminates independently.
     */
    void shutdown() {
        ISOWORKER_LOG_INFO(config_.name + " shutting down");
        for (auto& worker : workers_) {
            worker->shutdown();
        }
    }

    /**
     * @brief Force every worker down and close the merged stream at once
     *
     * Outcomes still held by the forwarders are discarded.
     */
    void force_shutdown() noexcept {
        for (auto& worker : workers_) {
            worker->force_shutdown();
        }
        merged_->close();
    }

    /**
     * @brief Wait until every worker has terminated
     */
    void join() {
        for (auto& worker : workers_) {
            worker->join();
        }
    }

    [[nodiscard]] OutputStream<Result>& output_stream() noexcept { return stream_; }

    [[nodiscard]] std::size_t worker_count() const noexcept { return workers_.size(); }

    [[nodiscard]] std::size_t cursor() const {
        std::lock_guard<std::mutex> lock(cursor_mutex_);
        return cursor_;
    }

    [[nodiscard]] const WorkerType& worker(std::size_t index) const {
        return *workers_.at(index);
    }

    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }

private:
    // Subscription to one worker's stream; the last one to finish closes
    // the merged stream
    void forward(WorkerType* worker) {
        set_thread_name(worker->name() + "/forward");

        while (auto outcome = worker->output_stream().next_outcome()) {
            merged_->push(std::move(*outcome));
        }

        if (open_streams_.fetch_sub(1) == 1) {
            ISOWORKER_LOG_DEBUG(config_.name + ": all worker streams closed");
            merged_->close();
        }
    }

    PoolConfig config_;
    std::vector<std::unique_ptr<WorkerType>> workers_;

    mutable std::mutex cursor_mutex_;
    std::size_t cursor_{0};

    std::shared_ptr<Channel<Outcome<Result>>> merged_;
    OutputStream<Result> stream_;
    std::vector<std::thread> forwarders_;
    std::atomic<std::size_t> open_streams_{0};
    std::atomic<bool> started_{false};
};

} // namespace isoworker
