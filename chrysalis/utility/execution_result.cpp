#include "utility/execution_result.hpp"

namespace chrysalis::utility {

ExecutionResult ExecutionResult::value(const Utility &utility, Payload payload) {
    ExecutionResult result(utility, Type::Value);
    result.payload_ = std::move(payload);
    return result;
}

ExecutionResult ExecutionResult::warning(const Utility &utility, std::string message, Payload payload) {
    ExecutionResult result(utility, Type::Warning);
    result.warning_message_ = std::move(message);
    result.payload_ = std::move(payload);
    return result;
}

ExecutionResult ExecutionResult::error(const Utility &utility, UtilityException exception) {
    ExecutionResult result(utility, Type::Error);
    result.exception_ = std::make_shared<UtilityException>(std::move(exception));
    return result;
}

const char *type_name(ExecutionResult::Type type) {
    switch (type) {
        case ExecutionResult::Type::Value:
            return "VALUE";
        case ExecutionResult::Type::Warning:
            return "WARNING";
        case ExecutionResult::Type::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace chrysalis::utility
