#include "utilities/find_files.hpp"
#include "utility/validation.hpp"
#include "utils/filesystem.hpp"
#include <regex>
#include <spdlog/spdlog.h>

namespace chrysalis::utilities {

namespace fs = std::filesystem;
using utility::ExecutionResult;
using utility::UtilityException;

namespace {

std::string display_path(const fs::path &app_root, const fs::path &path) {
    std::string relative = utils::relative_path(app_root, path);
    return relative.empty() ? "." : relative;
}

} // namespace

FindFiles::FindFiles() : utility::Utility("FindFiles") {}

FindFiles::FindFiles(const std::string &name_regex, bool recursive) : FindFiles() {
    set_name_regex(name_regex);
    set_recursive(recursive);
}

FindFiles::FindFiles(const std::string &name_regex, const std::string &path_regex) : FindFiles() {
    set_name_regex(name_regex);
    set_path_regex(path_regex);
}

FindFiles &FindFiles::set_name_regex(const std::optional<std::string> &name_regex) {
    utility::check_for_empty_string("Name regex", name_regex);
    if (name_regex) {
        utility::check_for_valid_regex("Name regex", *name_regex);
    }
    name_regex_ = name_regex;
    return *this;
}

FindFiles &FindFiles::set_path_regex(const std::optional<std::string> &path_regex) {
    utility::check_for_empty_string("Path regex", path_regex);
    if (path_regex) {
        utility::check_for_valid_regex("Path regex", *path_regex);
        recursive_ = true;
    }
    path_regex_ = path_regex;
    return *this;
}

FindFiles &FindFiles::set_recursive(bool recursive) {
    recursive_ = recursive;
    if (!recursive) {
        path_regex_.reset();
    }
    return *this;
}

FindFiles &FindFiles::relative(const std::string &relative_path) {
    location_.set_relative(relative_path);
    return *this;
}

FindFiles &FindFiles::absolute(const std::string &attribute, const std::string &relative_path) {
    location_.set_absolute(attribute, relative_path);
    return *this;
}

std::string FindFiles::get_description() const {
    std::string folder = location_.is_application_root() ? "the root folder" : location_.relative_path();
    if (location_.is_absolute()) {
        folder = "${" + *location_.absolute_attribute() + "}" +
                 (location_.relative_path().empty() ? "" : "/" + location_.relative_path());
    }

    return "Find files whose name and/or path match regular expression and are under " + folder +
           (recursive_ ? " and sub-folders" : " only (not including sub-folders)");
}

ExecutionResult FindFiles::execution(const fs::path &app_root,
                                     const utility::TransformationContext &context) const {
    fs::path search_root;
    try {
        search_root = location_.resolve(app_root, context);

        if (!fs::is_directory(search_root)) {
            throw UtilityException("Search root folder " + display_path(app_root, search_root) +
                                   " does not exist or is not a folder");
        }

        std::optional<std::regex> name_filter;
        std::optional<std::regex> path_filter;
        if (name_regex_) {
            name_filter.emplace(*name_regex_);
        }
        if (path_regex_) {
            path_filter.emplace(*path_regex_);
        }

        auto filter = [&](const fs::path &file) {
            if (name_filter && !std::regex_match(file.filename().string(), *name_filter)) {
                return false;
            }
            if (path_filter) {
                std::string directory = utils::relative_path(search_root, file.parent_path());
                if (!std::regex_match(directory, *path_filter)) {
                    return false;
                }
            }
            return true;
        };

        spdlog::debug("{}: searching {} (recursive: {})", name(), search_root.string(), recursive_);
        utility::FileList files = utils::list_files(search_root, filter, recursive_);

        if (files.empty()) {
            spdlog::warn("{}: no files have been found under {}", name(), search_root.string());
            return ExecutionResult::warning(*this, "No files have been found", utility::FileList{});
        }

        spdlog::debug("{}: found {} files", name(), files.size());
        return ExecutionResult::value(*this, std::move(files));
    } catch (const UtilityException &e) {
        spdlog::error("{}: {}", name(), e.what());
        return ExecutionResult::error(*this, e);
    } catch (const std::exception &e) {
        std::string details = "Exception happened when searching for files under " +
                              display_path(app_root, search_root);
        spdlog::error("{}: {}: {}", name(), details, e.what());
        return ExecutionResult::error(*this, UtilityException(details, std::current_exception()));
    }
}

} // namespace chrysalis::utilities
