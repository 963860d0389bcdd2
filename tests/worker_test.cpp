/**
 * @file worker_test.cpp
 * @brief Unit tests for Worker lifecycle and shutdown ordering
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "isoworker/isoworker.hpp"

using namespace isoworker;

namespace {

template<typename Result>
std::vector<Result> drain(OutputStream<Result>& stream) {
    std::vector<Result> results;
    for (auto& value : stream) {
        results.push_back(value);
    }
    return results;
}

} // namespace

class WorkerTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(WorkerTest, StartsInCreatedState) {
    Worker<int, int> worker([](int x) { return x; });

    EXPECT_EQ(worker.state(), WorkerState::Created);
    EXPECT_EQ(worker.name(), "worker");
    EXPECT_STREQ(to_string(worker.state()), "Created");
}

TEST_F(WorkerTest, StartMovesToRunning) {
    Worker<int, int> worker([](int x) { return x; }, "w0");

    auto started = worker.start();
    started.get();

    EXPECT_EQ(worker.state(), WorkerState::Running);
}

TEST_F(WorkerTest, DoubleStartThrows) {
    Worker<int, int> worker([](int x) { return x; });

    worker.start().get();
    EXPECT_THROW(worker.start(), std::runtime_error);
}

TEST_F(WorkerTest, IdentityRoundTrip) {
    Worker<int, int> worker([](int x) { return x; });
    worker.start().get();

    worker.send_all(std::vector<int>{1, 2, 3, 4, 5});
    worker.shutdown();

    EXPECT_EQ(drain(worker.output_stream()), (std::vector<int>{1, 2, 3, 4, 5}));

    // Closed with no further items
    EXPECT_FALSE(worker.output_stream().next().has_value());
    EXPECT_TRUE(worker.output_stream().is_done());
}

TEST_F(WorkerTest, DoublingPreservesOrder) {
    Worker<int, int> worker([](int x) { return x * 2; });
    worker.start().get();

    worker.send(1);
    worker.send(2);
    worker.send(3);
    worker.shutdown();

    EXPECT_EQ(drain(worker.output_stream()), (std::vector<int>{2, 4, 6}));
}

TEST_F(WorkerTest, ShutdownDrainsEveryQueuedInput) {
    // Slow function so that most inputs are still queued at shutdown()
    Worker<int, int> worker([](int x) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return x;
    });
    worker.start().get();

    constexpr int count = 200;
    for (int i = 0; i < count; i++) {
        worker.send(i);
    }
    worker.shutdown();

    auto results = drain(worker.output_stream());
    ASSERT_EQ(results.size(), static_cast<std::size_t>(count));
    for (int i = 0; i < count; i++) {
        EXPECT_EQ(results[i], i);
    }

    worker.join();
    EXPECT_EQ(worker.state(), WorkerState::Terminated);
}

TEST_F(WorkerTest, SendAfterShutdownIsIgnored) {
    Worker<int, int> worker([](int x) { return x; });
    worker.start().get();

    worker.send(1);
    worker.shutdown();
    worker.send(2);
    worker.send(3);

    EXPECT_EQ(drain(worker.output_stream()), (std::vector<int>{1}));

    // Still ignored once terminated
    worker.join();
    worker.send(4);
    EXPECT_FALSE(worker.output_stream().next().has_value());
}

TEST_F(WorkerTest, ShutdownIsIdempotent) {
    Worker<int, int> worker([](int x) { return x; });
    worker.start().get();

    worker.send(7);
    worker.shutdown();
    worker.shutdown();

    EXPECT_EQ(drain(worker.output_stream()), (std::vector<int>{7}));
    worker.join();
    EXPECT_EQ(worker.state(), WorkerState::Terminated);
}

TEST_F(WorkerTest, ShutdownWithNoInputs) {
    Worker<int, int> worker([](int x) { return x; });
    worker.start().get();

    worker.shutdown();

    EXPECT_TRUE(drain(worker.output_stream()).empty());
    worker.join();
    EXPECT_EQ(worker.state(), WorkerState::Terminated);
}

TEST_F(WorkerTest, SendBeforeStartIsDropped) {
    Worker<int, int> worker([](int x) { return x; });

    worker.send(1);
    worker.start().get();
    worker.send(2);
    worker.shutdown();

    EXPECT_EQ(drain(worker.output_stream()), (std::vector<int>{2}));
}

TEST_F(WorkerTest, ForceShutdownBeforeStart) {
    Worker<int, int> worker([](int x) { return x; });

    EXPECT_NO_THROW(worker.force_shutdown());
    EXPECT_TRUE(worker.output_stream().is_closed());
    EXPECT_EQ(worker.state(), WorkerState::Terminated);
    EXPECT_THROW(worker.start(), std::runtime_error);
}

TEST_F(WorkerTest, ForceShutdownBeforeHandshake) {
    Worker<int, int> worker([](int x) { return x; });

    auto started = worker.start();
    EXPECT_NO_THROW(worker.force_shutdown());
    EXPECT_NO_THROW(started.get());

    EXPECT_TRUE(worker.output_stream().is_closed());
    worker.join();
}

TEST_F(WorkerTest, ForceShutdownWhileRunning) {
    Worker<int, int> worker([](int x) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return x;
    });
    worker.start().get();

    for (int i = 0; i < 1000; i++) {
        worker.send(i);
    }
    worker.force_shutdown();

    EXPECT_TRUE(worker.output_stream().is_closed());
    EXPECT_EQ(worker.state(), WorkerState::Terminated);

    // Whatever was emitted before closure is a prefix of the inputs
    auto results = drain(worker.output_stream());
    EXPECT_LT(results.size(), 1000u);
    for (std::size_t i = 0; i < results.size(); i++) {
        EXPECT_EQ(results[i], static_cast<int>(i));
    }

    worker.join();
}

TEST_F(WorkerTest, ForceShutdownIsRepeatable) {
    Worker<int, int> worker([](int x) { return x; });
    worker.start().get();

    worker.send(1);
    worker.shutdown();
    EXPECT_EQ(drain(worker.output_stream()), (std::vector<int>{1}));

    EXPECT_NO_THROW(worker.force_shutdown());
    EXPECT_NO_THROW(worker.force_shutdown());
    EXPECT_TRUE(worker.output_stream().is_closed());
    EXPECT_EQ(worker.state(), WorkerState::Terminated);
}

TEST_F(WorkerTest, ShutdownAfterForceShutdownIsNoop) {
    Worker<int, int> worker([](int x) { return x; });
    worker.start().get();

    worker.force_shutdown();
    EXPECT_NO_THROW(worker.shutdown());
    EXPECT_EQ(worker.state(), WorkerState::Terminated);
}

TEST_F(WorkerTest, DeferredResults) {
    Worker<int, int> worker([](int x) {
        return std::async(std::launch::async, [x] { return x + 100; });
    });
    worker.start().get();

    worker.send_all(std::vector<int>{1, 2, 3});
    worker.shutdown();

    // Deferred completions may arrive in any order, but none is lost
    auto results = drain(worker.output_stream());
    std::sort(results.begin(), results.end());
    EXPECT_EQ(results, (std::vector<int>{101, 102, 103}));
}

TEST_F(WorkerTest, DeferredCompletionOrderFollowsCompletion) {
    // The first input resolves last
    Worker<int, int> worker([](int x) {
        return std::async(std::launch::async, [x] {
            std::this_thread::sleep_for(std::chrono::milliseconds(x == 0 ? 200 : 0));
            return x;
        });
    });
    worker.start().get();

    worker.send(0);
    worker.send(1);
    worker.shutdown();

    EXPECT_EQ(drain(worker.output_stream()), (std::vector<int>{1, 0}));
}

TEST_F(WorkerTest, ForceShutdownDoesNotWaitForDeferredResults) {
    auto gate = std::make_shared<std::promise<int>>();
    auto called = std::make_shared<std::atomic<bool>>(false);

    auto worker = std::make_unique<Worker<int, int>>([gate, called](int) {
        called->store(true);
        return gate->get_future();
    });
    worker->start().get();

    worker->send(1);
    while (!called->load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    auto begin = std::chrono::steady_clock::now();
    worker->force_shutdown();
    EXPECT_TRUE(worker->output_stream().is_closed());
    worker.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));

    // Resolve the abandoned result; it is rejected by the closed output
    gate->set_value(1);
}

TEST_F(WorkerTest, ForceShutdownCancelsDrainOfDeferredResults) {
    auto gate = std::make_shared<std::promise<int>>();
    auto called = std::make_shared<std::atomic<bool>>(false);

    Worker<int, int> worker([gate, called](int) {
        called->store(true);
        return gate->get_future();
    });
    worker.start().get();

    worker.send(1);
    worker.shutdown();
    while (!called->load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    auto begin = std::chrono::steady_clock::now();
    worker.force_shutdown();
    worker.join();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
    EXPECT_EQ(worker.state(), WorkerState::Terminated);

    gate->set_value(1);
}

TEST_F(WorkerTest, FaultIsForwardedAsFailure) {
    Worker<int, int> worker([](int x) {
        if (x == 2) {
            throw std::invalid_argument("two");
        }
        return x;
    });
    worker.start().get();

    worker.send_all(std::vector<int>{1, 2, 3});
    worker.shutdown();

    auto& stream = worker.output_stream();

    auto first = stream.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 1);

    EXPECT_THROW(stream.next(), std::invalid_argument);

    // The worker survives the fault
    auto third = stream.next();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(*third, 3);

    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(WorkerTest, DeferredFaultIsForwardedAsFailure) {
    Worker<int, int> worker([](int x) {
        return std::async(std::launch::async, [x]() -> int {
            throw std::runtime_error("deferred " + std::to_string(x));
        });
    });
    worker.start().get();

    worker.send(9);
    worker.shutdown();

    auto outcome = worker.output_stream().next_outcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->ok());
    EXPECT_THROW((void)outcome->value(), std::runtime_error);

    EXPECT_FALSE(worker.output_stream().next_outcome().has_value());
}

TEST_F(WorkerTest, NextForTimesOutWhileOpen) {
    Worker<int, int> worker([](int x) { return x; });
    worker.start().get();

    EXPECT_FALSE(worker.output_stream().next_for(std::chrono::milliseconds(20)).has_value());
    EXPECT_FALSE(worker.output_stream().is_closed());

    worker.send(5);
    auto value = worker.output_stream().next_for(std::chrono::seconds(5));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 5);

    worker.shutdown();
}

TEST_F(WorkerTest, RunsOnItsOwnThread) {
    Worker<int, std::thread::id> worker([](int) { return std::this_thread::get_id(); });
    worker.start().get();

    worker.send_all(std::vector<int>{0, 1, 2});
    worker.shutdown();

    auto ids = drain(worker.output_stream());
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_NE(ids[0], std::this_thread::get_id());
    EXPECT_EQ(ids[0], ids[1]);
    EXPECT_EQ(ids[1], ids[2]);
}

TEST_F(WorkerTest, StringPayloads) {
    Worker<std::string, std::size_t> worker([](const std::string& s) { return s.size(); });
    worker.start().get();

    worker.send("a");
    worker.send("abc");
    worker.send("");
    worker.shutdown();

    EXPECT_EQ(drain(worker.output_stream()), (std::vector<std::size_t>{1, 3, 0}));
}

TEST_F(WorkerTest, InputStatsCountQueuedMessages) {
    Worker<int, int> worker([](int x) { return x; });
    worker.start().get();

    worker.send_all(std::vector<int>{1, 2, 3});
    worker.shutdown();
    drain(worker.output_stream());
    worker.join();

    // Three inputs plus the sentinel
    EXPECT_EQ(worker.input_stats().push_count, 4u);
    EXPECT_EQ(worker.output_stats().push_count, 3u);
}

TEST_F(WorkerTest, DestructorReleasesRunningWorker) {
    auto worker = std::make_unique<Worker<int, int>>([](int x) { return x; });
    worker->start().get();
    worker->send(1);

    // No shutdown: the destructor must still release every thread
    EXPECT_NO_THROW(worker.reset());
}
