/*
 * exception.hpp
 *
 * Copyright (C) 2024 weave contributors
 */

/*************************************************

Date: 2024-5-18

Description: Exception types carrying the location of the throw site

**************************************************/

#ifndef WEAVE_ERROR_EXCEPTION_HPP
#define WEAVE_ERROR_EXCEPTION_HPP

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/fmt/fmt.h>

#define WEAVE_FILE_NAME __FILE__
#define WEAVE_FILE_LINE __LINE__
#define WEAVE_FUNC_NAME __func__

namespace weave::error {

/**
 * @brief Base exception of the library.
 *
 * Records the file, line and function of the throw site together with the
 * id of the throwing thread. The message is built with fmt from a format
 * string and its arguments.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              fmt::format_string<Args...> format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          message_(fmt::format(format, std::forward<Args>(args)...)),
          thread_id_(std::this_thread::get_id()) {
        full_message_ = buildFullMessage();
    }

    /**
     * @brief Full description including the throw site.
     */
    [[nodiscard]] auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    /**
     * @brief The formatted message without location details.
     */
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    [[nodiscard]] auto buildFullMessage() const -> std::string;

    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    std::thread::id thread_id_;
    std::string full_message_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Returns the message of the exception held by @p error.
 *
 * For library exceptions this is the short message, for any other
 * std::exception its what(). Returns an empty string for a null pointer.
 */
[[nodiscard]] auto describe(const std::exception_ptr& error) -> std::string;

}  // namespace weave::error

#define THROW_RUNTIME_ERROR(...)                                  \
    throw weave::error::RuntimeError(WEAVE_FILE_NAME, WEAVE_FILE_LINE, \
                                     WEAVE_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                  \
    throw weave::error::InvalidArgument(WEAVE_FILE_NAME, WEAVE_FILE_LINE, \
                                        WEAVE_FUNC_NAME, __VA_ARGS__)

#endif  // WEAVE_ERROR_EXCEPTION_HPP
