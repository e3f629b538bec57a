#include "filesystem.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace chrysalis::utils {

namespace fs = std::filesystem;

std::vector<fs::path> list_files(const fs::path &dir_path, const FileFilter &filter, bool recursive) {
    std::vector<fs::path> files;

    auto accept = [&](const fs::directory_entry &entry) {
        // Throwing overloads: a broken entry fails the walk instead of vanishing
        if (entry.is_regular_file() && (!filter || filter(entry.path()))) {
            files.push_back(entry.path());
        }
    };

    if (recursive) {
        for (const auto &entry : fs::recursive_directory_iterator(dir_path)) {
            accept(entry);
        }
    } else {
        for (const auto &entry : fs::directory_iterator(dir_path)) {
            accept(entry);
        }
    }

    std::sort(files.begin(), files.end());
    spdlog::debug("Listed {} files under {}", files.size(), dir_path.string());

    return files;
}

std::string normalize_separators(const std::string &path) {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    return normalized;
}

std::string relative_path(const fs::path &base, const fs::path &path) {
    auto relative = path.lexically_normal().lexically_relative(base.lexically_normal());
    if (relative.empty()) {
        // Unrelated roots (one absolute, one relative)
        return normalize_separators(path.generic_string());
    }
    if (relative == ".") {
        return "";
    }
    return normalize_separators(relative.generic_string());
}

} // namespace chrysalis::utils
