#ifndef WEAVE_ASYNC_ERRORS_HPP
#define WEAVE_ASYNC_ERRORS_HPP

#include <exception>

#include "weave/error/exception.hpp"

namespace weave::async {

/**
 * @brief Signals that the outcome of an operation was discarded.
 *
 * Raised for superseded or reset executions. It is not a task failure:
 * retry loops rethrow it immediately and it is never reported to error
 * callbacks.
 */
class CancelledError : public weave::error::RuntimeError {
public:
    using weave::error::RuntimeError::RuntimeError;
};

/**
 * @brief Delivered to tasks a queue dropped before they started.
 */
class QueueClearedError : public weave::error::RuntimeError {
public:
    using weave::error::RuntimeError::RuntimeError;
};

/**
 * @brief Raised when a wait exceeds its deadline.
 */
class TimeoutError : public weave::error::RuntimeError {
public:
    using weave::error::RuntimeError::RuntimeError;
};

#define THROW_CANCELLED_ERROR(...)                                        \
    throw weave::async::CancelledError(WEAVE_FILE_NAME, WEAVE_FILE_LINE, \
                                       WEAVE_FUNC_NAME, __VA_ARGS__)

#define THROW_TIMEOUT_ERROR(...)                                        \
    throw weave::async::TimeoutError(WEAVE_FILE_NAME, WEAVE_FILE_LINE, \
                                     WEAVE_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Whether @p error holds a CancelledError.
 */
[[nodiscard]] inline bool isCancellation(const std::exception_ptr& error) {
    if (!error) {
        return false;
    }
    try {
        std::rethrow_exception(error);
    } catch (const CancelledError&) {
        return true;
    } catch (...) {
        return false;
    }
}

}  // namespace weave::async

#endif  // WEAVE_ASYNC_ERRORS_HPP
