#ifndef CHRYSALIS_UTILITY_PATH_RESOLVER_HPP
#define CHRYSALIS_UTILITY_PATH_RESOLVER_HPP

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace chrysalis::utility {

// Named attributes shared between utilities of one transformation
class TransformationContext {
public:
    void set(const std::string &name, const std::filesystem::path &value) { attributes_[name] = value; }
    bool contains(const std::string &name) const { return attributes_.count(name) != 0; }
    std::optional<std::filesystem::path> get(const std::string &name) const;

private:
    std::unordered_map<std::string, std::filesystem::path> attributes_;
};

// Where a utility operates: a path under the application root, or a path
// taken from a context attribute, optionally with a path under it.
class Location {
public:
    void set_relative(const std::string &relative_path);
    void set_absolute(const std::string &attribute, const std::string &relative_path = "");

    bool is_absolute() const { return absolute_attribute_.has_value(); }
    const std::string &relative_path() const { return relative_path_; }
    const std::optional<std::string> &absolute_attribute() const { return absolute_attribute_; }

    // True when nothing narrows the location down from the application root
    bool is_application_root() const;

    // Throws UtilityException if the absolute attribute is missing from context
    std::filesystem::path resolve(const std::filesystem::path &app_root,
                                  const TransformationContext &context) const;

private:
    std::string relative_path_;
    std::optional<std::string> absolute_attribute_;
};

} // namespace chrysalis::utility

#endif // CHRYSALIS_UTILITY_PATH_RESOLVER_HPP
