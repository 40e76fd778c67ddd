/*
 * exception.cpp
 *
 * Copyright (C) 2024 weave contributors
 */

#include "exception.hpp"

#include <sstream>

namespace weave::error {

auto Exception::what() const noexcept -> const char* {
    return full_message_.c_str();
}

auto Exception::buildFullMessage() const -> std::string {
    std::ostringstream oss;
    oss << "Exception occurred:\n";
    oss << "  File: " << file_ << "\n";
    oss << "  Line: " << line_ << "\n";
    oss << "  Function: " << func_ << "()\n";
    oss << "  Thread ID: " << thread_id_ << "\n";
    oss << "  Message: " << message_ << "\n";
    return oss.str();
}

auto Exception::getFile() const -> std::string { return file_; }
auto Exception::getLine() const -> int { return line_; }
auto Exception::getFunction() const -> std::string { return func_; }
auto Exception::getMessage() const -> std::string { return message_; }
auto Exception::getThreadId() const -> std::thread::id { return thread_id_; }

auto describe(const std::exception_ptr& error) -> std::string {
    if (!error) {
        return {};
    }
    try {
        std::rethrow_exception(error);
    } catch (const Exception& e) {
        return e.getMessage();
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

}  // namespace weave::error
