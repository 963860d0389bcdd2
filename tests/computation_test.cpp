/**
 * @file computation_test.cpp
 * @brief Unit tests for Computation
 */

#include <gtest/gtest.h>
#include <future>
#include <string>
#include <variant>

#include "isoworker/core/computation.hpp"

using namespace isoworker;

class ComputationTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ComputationTest, ImmediateResult) {
    Computation<int, int> square([](int x) { return x * x; });

    auto completion = square(5);
    ASSERT_EQ(completion.index(), 0u);
    EXPECT_EQ(std::get<0>(completion), 25);
}

TEST_F(ComputationTest, ConvertibleResult) {
    Computation<int, long> widen([](int x) { return x + 1; });

    auto completion = widen(41);
    ASSERT_EQ(completion.index(), 0u);
    EXPECT_EQ(std::get<0>(completion), 42L);
}

TEST_F(ComputationTest, DeferredResult) {
    Computation<int, int> later([](int x) {
        return std::async(std::launch::async, [x] { return x * 2; });
    });

    auto completion = later(21);
    ASSERT_EQ(completion.index(), 1u);
    EXPECT_EQ(std::get<1>(completion).get(), 42);
}

TEST_F(ComputationTest, CompletionChosenPerCall) {
    Computation<int, std::string> mixed([](int x) -> Completion<std::string> {
        if (x % 2 == 0) {
            return Completion<std::string>(std::in_place_index<0>, "even");
        }
        std::promise<std::string> promise;
        promise.set_value("odd");
        return Completion<std::string>(std::in_place_index<1>, promise.get_future());
    });

    auto even = mixed(2);
    ASSERT_EQ(even.index(), 0u);
    EXPECT_EQ(std::get<0>(even), "even");

    auto odd = mixed(3);
    ASSERT_EQ(odd.index(), 1u);
    EXPECT_EQ(std::get<1>(odd).get(), "odd");
}

TEST_F(ComputationTest, CopiesAreIndependent) {
    int calls = 0;
    Computation<int, int> counting([calls](int x) mutable { return x + ++calls; });
    Computation<int, int> copy = counting;

    EXPECT_EQ(std::get<0>(counting(0)), 1);
    EXPECT_EQ(std::get<0>(counting(0)), 2);

    // The copy carries its own state
    EXPECT_EQ(std::get<0>(copy(0)), 1);
    EXPECT_EQ(calls, 0);
}
