#include "utility/exceptions.hpp"

namespace chrysalis::utility {

std::string UtilityException::cause_message() const {
    return cause_ ? describe(cause_) : "";
}

std::string describe(const std::exception_ptr &exception) {
    if (!exception) {
        return "";
    }

    try {
        std::rethrow_exception(exception);
    } catch (const std::exception &e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace chrysalis::utility
