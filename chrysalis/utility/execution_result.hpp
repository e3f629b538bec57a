#ifndef CHRYSALIS_UTILITY_EXECUTION_RESULT_HPP
#define CHRYSALIS_UTILITY_EXECUTION_RESULT_HPP

#pragma once

#include "utility/exceptions.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chrysalis::utility {

class Utility;

using FileList = std::vector<std::filesystem::path>;
using Payload = std::variant<std::monostate, bool, FileList>;

// Outcome of a single Utility::execution call
class ExecutionResult {
public:
    enum class Type { Value, Warning, Error };

    static ExecutionResult value(const Utility &utility, Payload payload);
    static ExecutionResult warning(const Utility &utility, std::string message, Payload payload);
    static ExecutionResult error(const Utility &utility, UtilityException exception);

    Type type() const { return type_; }

    // The result only points at the utility that produced it, which must
    // outlive the result. Copying a result does not extend that lifetime.
    const Utility &utility() const { return *utility_; }

    bool has_value() const { return !std::holds_alternative<std::monostate>(payload_); }
    const Payload &payload() const { return payload_; }

    // Throws std::bad_variant_access if the payload holds another type
    template<typename T>
    const T &value() const { return std::get<T>(payload_); }

    const std::optional<std::string> &warning_message() const { return warning_message_; }

    // Null unless type() is Error
    const UtilityException *exception() const { return exception_.get(); }

private:
    ExecutionResult(const Utility &utility, Type type) : utility_(&utility), type_(type) {}

    const Utility *utility_;
    Type type_;
    Payload payload_;
    std::optional<std::string> warning_message_;
    std::shared_ptr<const UtilityException> exception_;
};

const char *type_name(ExecutionResult::Type type);

} // namespace chrysalis::utility

#endif // CHRYSALIS_UTILITY_EXECUTION_RESULT_HPP
