#ifndef CHRYSALIS_UTILITY_UTILITY_HPP
#define CHRYSALIS_UTILITY_UTILITY_HPP

#pragma once

#include "utility/execution_result.hpp"
#include "utility/path_resolver.hpp"
#include <filesystem>
#include <string>
#include <utility>

namespace chrysalis::utility {

// A configured, single-shot inspection performed against a transformed application.
// execution() never throws; every failure comes back as an Error result.
class Utility {
public:
    explicit Utility(std::string name) : name_(std::move(name)) {}
    Utility(const Utility&) = default;
    Utility& operator=(const Utility&) = default;
    virtual ~Utility() = default;

    virtual std::string get_description() const = 0;
    virtual ExecutionResult execution(const std::filesystem::path &app_root,
                                      const TransformationContext &context) const = 0;

    const std::string &name() const { return name_; }
    void set_name(const std::string &name) { name_ = name; }

    const Location &location() const { return location_; }

protected:
    Location location_;

private:
    std::string name_;
};

} // namespace chrysalis::utility

#endif // CHRYSALIS_UTILITY_UTILITY_HPP
