#pragma once

/**
 * @file message.hpp
 * @brief Message types carried by worker channels
 */

#include <exception>
#include <future>
#include <utility>
#include <variant>

namespace isoworker {

/**
 * @brief Caller-supplied input wrapped for the input channel
 *
 * Every input travels inside Data, so no input value (not even one of
 * type Stop) can be confused with the termination sentinel.
 */
template<typename Input>
struct Data {
    Input value;
};

/**
 * @brief Termination sentinel
 *
 * Queued behind pending inputs on the input channel, then mirrored back
 * to the owner on the control channel once the worker has drained.
 */
struct Stop {};

/**
 * @brief Input or termination signal
 */
template<typename Input>
using Message = std::variant<Data<Input>, Stop>;

/**
 * @brief A result that becomes available later
 */
template<typename Result>
using Deferred = std::future<Result>;

/**
 * @brief Result of one function call, either ready now or deferred
 */
template<typename Result>
using Completion = std::variant<Result, Deferred<Result>>;

/**
 * @brief A forwarded result or the exception that replaced it
 */
template<typename Result>
class Outcome {
public:
    explicit Outcome(Result value)
        : state_(std::in_place_index<0>, std::move(value)) {}

    /**
     * @brief Build a failed outcome from a captured exception
     */
    static Outcome failure(std::exception_ptr error) {
        return Outcome(FailureTag{}, std::move(error));
    }

    [[nodiscard]] bool ok() const noexcept { return state_.index() == 0; }

    [[nodiscard]] std::exception_ptr error() const noexcept {
        if (auto* error = std::get_if<1>(&state_)) {
            return *error;
        }
        return nullptr;
    }

    /**
     * @brief Access the value (rethrows the captured exception on failure)
     */
    [[nodiscard]] const Result& value() const {
        if (!ok()) {
            std::rethrow_exception(std::get<1>(state_));
        }
        return std::get<0>(state_);
    }

    /**
     * @brief Move the value out (rethrows the captured exception on failure)
     */
    [[nodiscard]] Result take() {
        if (!ok()) {
            std::rethrow_exception(std::get<1>(state_));
        }
        return std::move(std::get<0>(state_));
    }

private:
    struct FailureTag {};

    Outcome(FailureTag, std::exception_ptr error)
        : state_(std::in_place_index<1>, std::move(error)) {}

    std::variant<Result, std::exception_ptr> state_;
};

} // namespace isoworker
