#include "utility/validation.hpp"
#include "utility/exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace chrysalis::utility {

void check_for_blank_string(const std::string &name, const std::string &value) {
    bool blank = std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        throw ConfigurationException(name + " cannot be blank");
    }
}

void check_for_empty_string(const std::string &name, const std::optional<std::string> &value) {
    if (value && value->empty()) {
        throw ConfigurationException(name + " cannot be empty");
    }
}

void check_for_valid_regex(const std::string &name, const std::string &pattern) {
    try {
        std::regex regex(pattern);
    } catch (const std::regex_error &e) {
        throw ConfigurationException(name + " is not a valid regular expression: " + e.what());
    }
}

} // namespace chrysalis::utility
