#pragma once

/**
 * @file computation.hpp
 * @brief Type-erased user function run inside a worker
 */

#include <functional>
#include <type_traits>
#include <utility>

#include "isoworker/core/message.hpp"

namespace isoworker {

/**
 * @brief The single function a worker runs, normalised to Completion
 *
 * Accepts any copyable callable taking one Input and returning either
 * Result (immediate), Deferred<Result> (completes later) or
 * Completion<Result> (chosen per call). The callable is copied into every
 * execution unit and must not capture mutable state shared with its
 * creator.
 */
template<typename Input, typename Result>
class Computation {
public:
    using Function = std::function<Completion<Result>(Input)>;

    template<typename Func,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<Func>, Computation>>>
    Computation(Func&& func)
        : func_(wrap(std::forward<Func>(func))) {}

    Completion<Result> operator()(Input input) const {
        return func_(std::move(input));
    }

private:
    template<typename Func>
    static Function wrap(Func&& func) {
        using Callable = std::decay_t<Func>;
        using Returned = std::invoke_result_t<Callable&, Input>;

        if constexpr (std::is_same_v<Returned, Completion<Result>>) {
            return Function(std::forward<Func>(func));
        } else if constexpr (std::is_same_v<Returned, Deferred<Result>>) {
            return [f = Callable(std::forward<Func>(func))](Input input) mutable {
                return Completion<Result>(std::in_place_index<1>, f(std::move(input)));
            };
        } else {
            static_assert(std::is_convertible_v<Returned, Result>,
                          "function must return Result, Deferred<Result> or Completion<Result>");
            return [f = Callable(std::forward<Func>(func))](Input input) mutable {
                return Completion<Result>(std::in_place_index<0>, f(std::move(input)));
            };
        }
    }

    Function func_;
};

} // namespace isoworker
