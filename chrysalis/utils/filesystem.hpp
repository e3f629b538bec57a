#ifndef CHRYSALIS_UTILS_FILESYSTEM_HPP
#define CHRYSALIS_UTILS_FILESYSTEM_HPP

#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace chrysalis::utils {

using FileFilter = std::function<bool(const std::filesystem::path &)>;

// Directory operations
// Walks directory_path and returns the regular files accepted by filter, sorted.
// Directory symlinks are not followed. Any walk error is rethrown as
// std::filesystem::filesystem_error.
std::vector<std::filesystem::path> list_files(const std::filesystem::path &directory_path,
                                              const FileFilter &filter,
                                              bool recursive = false);

// Path operations
std::string normalize_separators(const std::string &path);
std::string relative_path(const std::filesystem::path &base, const std::filesystem::path &path);

} // namespace chrysalis::utils

#endif // CHRYSALIS_UTILS_FILESYSTEM_HPP
