#ifndef CHRYSALIS_POM_POM_READER_HPP
#define CHRYSALIS_POM_POM_READER_HPP

#pragma once

#include <cstddef>
#include <istream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chrysalis::pom {

struct Parent {
    std::string group_id;
    std::string artifact_id;
    std::string version;
    std::string relative_path;
};

struct Dependency {
    std::string group_id;
    std::string artifact_id;
    std::string version;
    std::string type;
    std::string scope;
    bool optional = false;
};

// The subset of a Maven project descriptor the inspection utilities read
struct Model {
    std::string group_id;
    std::string artifact_id;
    std::string version;
    std::string packaging;
    std::string name;
    std::optional<Parent> parent;
    std::vector<std::string> modules;
    std::vector<Dependency> dependencies;
    std::map<std::string, std::string> properties;
};

class ParseException : public std::runtime_error {
public:
    ParseException(const std::string &message, size_t line, size_t column);

    const std::string &message() const { return message_; }
    size_t line() const { return line_; }
    size_t column() const { return column_; }

private:
    std::string message_;
    size_t line_;
    size_t column_;
};

class PomReader {
public:
    // Throws ParseException on malformed XML or a root element other than
    // <project>, std::ios_base::failure when the stream cannot be read
    Model read(std::istream &input) const;
};

} // namespace chrysalis::pom

#endif // CHRYSALIS_POM_POM_READER_HPP
