#ifndef CHRYSALIS_UTILITY_RESULT_REPORT_HPP
#define CHRYSALIS_UTILITY_RESULT_REPORT_HPP

#pragma once

#include "utility/execution_result.hpp"
#include <filesystem>
#include <string>

namespace chrysalis::utility {

// Escapes text for use inside a JSON string literal. Every byte below 0x20
// is written as an escape sequence.
std::string json_escape(const std::string &text);

// Result rendering for the command line. File payloads are listed relative
// to app_root.
std::string to_json(const ExecutionResult &result, const std::filesystem::path &app_root);
std::string to_text(const ExecutionResult &result, const std::filesystem::path &app_root);

} // namespace chrysalis::utility

#endif // CHRYSALIS_UTILITY_RESULT_REPORT_HPP
