#ifndef CHRYSALIS_UTILITY_VALIDATION_HPP
#define CHRYSALIS_UTILITY_VALIDATION_HPP

#pragma once

#include <optional>
#include <string>

namespace chrysalis::utility {

// Parameter checks used by utility setters. Each throws ConfigurationException.

// Rejects empty or whitespace-only values
void check_for_blank_string(const std::string &name, const std::string &value);

// Accepts nullopt, rejects an empty string
void check_for_empty_string(const std::string &name, const std::optional<std::string> &value);

// Rejects patterns std::regex cannot compile
void check_for_valid_regex(const std::string &name, const std::string &pattern);

} // namespace chrysalis::utility

#endif // CHRYSALIS_UTILITY_VALIDATION_HPP
