#include "utility/path_resolver.hpp"
#include "utility/exceptions.hpp"
#include "utils/filesystem.hpp"
#include <spdlog/spdlog.h>

namespace chrysalis::utility {

namespace fs = std::filesystem;

namespace {

// "/a\\b/" -> "a/b", so it can be appended under any root
fs::path to_sub_path(const std::string &relative_path) {
    std::string normalized = utils::normalize_separators(relative_path);
    size_t first = normalized.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    return fs::path(normalized.substr(first)).lexically_normal();
}

bool is_blank_or_dot(const std::string &path) {
    auto sub_path = to_sub_path(path);
    return sub_path.empty() || sub_path == ".";
}

} // namespace

std::optional<fs::path> TransformationContext::get(const std::string &name) const {
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Location::set_relative(const std::string &relative_path) {
    relative_path_ = relative_path;
    absolute_attribute_.reset();
}

void Location::set_absolute(const std::string &attribute, const std::string &relative_path) {
    absolute_attribute_ = attribute;
    relative_path_ = relative_path;
}

bool Location::is_application_root() const {
    return !absolute_attribute_ && is_blank_or_dot(relative_path_);
}

fs::path Location::resolve(const fs::path &app_root, const TransformationContext &context) const {
    fs::path base = app_root;

    if (absolute_attribute_) {
        auto attribute = context.get(*absolute_attribute_);
        if (!attribute) {
            throw UtilityException("Transformation context attribute " + *absolute_attribute_ +
                                   " does not exist");
        }
        base = *attribute;
    }

    if (is_blank_or_dot(relative_path_)) {
        return base;
    }

    fs::path resolved = base / to_sub_path(relative_path_);
    spdlog::debug("Resolved location {} to {}", relative_path_, resolved.string());
    return resolved;
}

} // namespace chrysalis::utility
