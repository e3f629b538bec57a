#ifndef CHRYSALIS_UTILITY_EXCEPTIONS_HPP
#define CHRYSALIS_UTILITY_EXCEPTIONS_HPP

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace chrysalis::utility {

// Thrown by setters when a utility is given an invalid parameter
class ConfigurationException : public std::runtime_error {
public:
    explicit ConfigurationException(const std::string &message) : std::runtime_error(message) {}
};

// Failure captured while a utility executes. Carries the underlying cause and
// any secondary failures that happened while cleaning up after it.
class UtilityException : public std::runtime_error {
public:
    explicit UtilityException(const std::string &message, std::exception_ptr cause = nullptr)
        : std::runtime_error(message), cause_(std::move(cause)) {}

    std::exception_ptr cause() const { return cause_; }

    // what() of the cause, or an empty string when there is none
    std::string cause_message() const;

    void add_suppressed(std::exception_ptr suppressed) { suppressed_.push_back(std::move(suppressed)); }
    const std::vector<std::exception_ptr> &suppressed() const { return suppressed_; }

private:
    std::exception_ptr cause_;
    std::vector<std::exception_ptr> suppressed_;
};

// Renders what() of any stored exception
std::string describe(const std::exception_ptr &exception);

} // namespace chrysalis::utility

#endif // CHRYSALIS_UTILITY_EXCEPTIONS_HPP
