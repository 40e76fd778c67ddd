#ifndef WEAVE_ASYNC_MUTATION_HPP
#define WEAVE_ASYNC_MUTATION_HPP

#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "weave/async/async_state.hpp"
#include "weave/error/exception.hpp"

namespace weave::async {

/**
 * @brief Observers of a Mutation, each receiving the variables of the run.
 */
template <typename TData, typename TVariables>
struct MutationOptions {
    std::function<void(const TData&, const TVariables&)> onSuccess;
    std::function<void(const std::exception_ptr&, const TVariables&)> onError;
    /// Runs after onSuccess or onError with whichever outcome occurred.
    std::function<void(const std::optional<TData>&, const std::exception_ptr&,
                       const TVariables&)>
        onSettled;
};

/**
 * @brief A write operation run on demand with tracked status.
 *
 * mutate() runs on the calling thread and rethrows failures after
 * recording them. Overlapping calls are allowed; the state reflects the
 * last one to finish.
 */
template <typename TData, typename TVariables>
class Mutation {
public:
    using Function = std::function<TData(const TVariables&)>;

    explicit Mutation(Function fn, MutationOptions<TData, TVariables> options = {})
        : fn_(std::move(fn)), options_(std::move(options)) {
        if (!fn_) {
            THROW_INVALID_ARGUMENT("Mutation requires a function");
        }
    }

    TData mutate(const TVariables& variables) {
        {
            std::lock_guard lock(mutex_);
            state_.status = AsyncStatus::Loading;
            state_.error = nullptr;
        }

        std::optional<TData> data;
        std::exception_ptr error;
        try {
            data = fn_(variables);
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::lock_guard lock(mutex_);
            if (error) {
                state_ = AsyncState<TData>{std::nullopt, error,
                                           AsyncStatus::Error};
            } else {
                state_ = AsyncState<TData>{data, nullptr, AsyncStatus::Success};
            }
        }

        if (error) {
            spdlog::debug("Mutation failed: {}", weave::error::describe(error));
            if (options_.onError) {
                options_.onError(error, variables);
            }
        } else if (options_.onSuccess) {
            options_.onSuccess(*data, variables);
        }
        if (options_.onSettled) {
            options_.onSettled(data, error, variables);
        }

        if (error) {
            std::rethrow_exception(error);
        }
        return std::move(*data);
    }

    /**
     * @brief Returns to Idle, forgetting data and error.
     */
    void reset() {
        std::lock_guard lock(mutex_);
        state_ = AsyncState<TData>{};
    }

    [[nodiscard]] AsyncState<TData> state() const {
        std::lock_guard lock(mutex_);
        return state_;
    }

private:
    Function fn_;
    MutationOptions<TData, TVariables> options_;

    AsyncState<TData> state_;
    mutable std::mutex mutex_;
};

}  // namespace weave::async

#endif  // WEAVE_ASYNC_MUTATION_HPP
