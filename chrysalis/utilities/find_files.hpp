#ifndef CHRYSALIS_UTILITIES_FIND_FILES_HPP
#define CHRYSALIS_UTILITIES_FIND_FILES_HPP

#pragma once

#include "utility/utility.hpp"
#include <optional>
#include <string>

namespace chrysalis::utilities {

// Finds files whose name and/or path match regular expressions. The search
// covers the immediate files of the search root unless recursive is set.
// A path regex is matched against the directory of each file relative to the
// search root, always written with '/' separators, and setting one makes the
// search recursive. Setting recursive to false drops the path regex.
//
// The search root defaults to the application root. If no files are found
// the result is a warning carrying an empty list.
class FindFiles : public utility::Utility {
public:
    FindFiles();
    FindFiles(const std::string &name_regex, bool recursive);
    FindFiles(const std::string &name_regex, const std::string &path_regex);

    FindFiles &set_name_regex(const std::optional<std::string> &name_regex);
    FindFiles &set_path_regex(const std::optional<std::string> &path_regex);
    FindFiles &set_recursive(bool recursive);

    FindFiles &relative(const std::string &relative_path);
    FindFiles &absolute(const std::string &attribute, const std::string &relative_path = "");

    const std::optional<std::string> &name_regex() const { return name_regex_; }
    const std::optional<std::string> &path_regex() const { return path_regex_; }
    bool is_recursive() const { return recursive_; }

    std::string get_description() const override;
    utility::ExecutionResult execution(const std::filesystem::path &app_root,
                                       const utility::TransformationContext &context) const override;

private:
    std::optional<std::string> name_regex_;
    std::optional<std::string> path_regex_;
    bool recursive_ {false};
};

} // namespace chrysalis::utilities

#endif // CHRYSALIS_UTILITIES_FIND_FILES_HPP
