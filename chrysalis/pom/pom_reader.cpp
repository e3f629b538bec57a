#include "pom/pom_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <ios>
#include <iterator>
#include <utility>
#include <pugixml.hpp>
#include <spdlog/spdlog.h>

namespace chrysalis::pom {

namespace {

std::string trim(const std::string &text) {
    const char *whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::string child_text(const pugi::xml_node &node, const char *name) {
    return trim(node.child(name).child_value());
}

// 1-based line and column of a byte offset
std::pair<size_t, size_t> position_of(const std::string &content, ptrdiff_t offset) {
    size_t end = std::min(static_cast<size_t>(std::max<ptrdiff_t>(offset, 0)), content.size());
    size_t line = 1;
    size_t column = 1;
    for (size_t i = 0; i < end; ++i) {
        if (content[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

bool is_blank(const char *text) {
    for (; *text; ++text) {
        if (std::string(" \t\r\n").find(*text) == std::string::npos) {
            return false;
        }
    }
    return true;
}

// Length of a predefined entity or character reference starting at '&', or 0
size_t reference_length(const std::string &content, size_t start) {
    static const char *predefined[] = {"&lt;", "&gt;", "&amp;", "&apos;", "&quot;"};
    for (const char *entity : predefined) {
        if (content.compare(start, std::char_traits<char>::length(entity), entity) == 0) {
            return std::char_traits<char>::length(entity);
        }
    }

    if (content.compare(start, 2, "&#") != 0) {
        return 0;
    }
    size_t i = start + 2;
    bool hex = i < content.size() && content[i] == 'x';
    if (hex) {
        ++i;
    }
    size_t digits = i;
    while (i < content.size() && (hex ? std::isxdigit(static_cast<unsigned char>(content[i]))
                                      : std::isdigit(static_cast<unsigned char>(content[i])))) {
        ++i;
    }
    if (i == digits || i >= content.size() || content[i] != ';') {
        return 0;
    }
    return i - start + 1;
}

// pugixml keeps unknown entity references as literal text; reject them the
// way a strict XML reader does. Comments, CDATA sections and processing
// instructions are skipped.
void check_references(const std::string &content) {
    static const std::pair<const char *, const char *> skipped[] = {
        {"<!--", "-->"}, {"<![CDATA[", "]]>"}, {"<?", "?>"}};

    size_t i = 0;
    while (i < content.size()) {
        bool skipped_section = false;
        for (const auto &[open, close] : skipped) {
            if (content.compare(i, std::char_traits<char>::length(open), open) == 0) {
                size_t end = content.find(close, i);
                i = end == std::string::npos ? content.size() : end + std::char_traits<char>::length(close);
                skipped_section = true;
                break;
            }
        }
        if (skipped_section) {
            continue;
        }

        if (content[i] == '&') {
            size_t length = reference_length(content, i);
            if (length == 0) {
                auto [line, column] = position_of(content, static_cast<ptrdiff_t>(i));
                throw ParseException("Unknown or malformed entity reference", line, column);
            }
            i += length;
            continue;
        }
        ++i;
    }
}

// Exactly one root element, and no text beside it
pugi::xml_node document_root(const pugi::xml_document &document, const std::string &content) {
    pugi::xml_node root;
    for (pugi::xml_node node : document.children()) {
        if (node.type() == pugi::node_element) {
            if (root) {
                auto [line, column] = position_of(content, node.offset_debug());
                throw ParseException("Only one root element is allowed", line, column);
            }
            root = node;
        } else if (node.type() == pugi::node_pcdata && !is_blank(node.value())) {
            auto [line, column] = position_of(content, node.offset_debug());
            throw ParseException("Only whitespace content is allowed outside the root element", line, column);
        }
    }

    if (!root) {
        throw ParseException("No document element found", 1, 1);
    }
    return root;
}

Parent read_parent(const pugi::xml_node &node) {
    Parent parent;
    parent.group_id = child_text(node, "groupId");
    parent.artifact_id = child_text(node, "artifactId");
    parent.version = child_text(node, "version");
    parent.relative_path = child_text(node, "relativePath");
    return parent;
}

Dependency read_dependency(const pugi::xml_node &node) {
    Dependency dependency;
    dependency.group_id = child_text(node, "groupId");
    dependency.artifact_id = child_text(node, "artifactId");
    dependency.version = child_text(node, "version");
    dependency.type = child_text(node, "type");
    dependency.scope = child_text(node, "scope");
    dependency.optional = child_text(node, "optional") == "true";
    if (dependency.type.empty()) {
        dependency.type = "jar";
    }
    return dependency;
}

} // namespace

ParseException::ParseException(const std::string &message, size_t line, size_t column)
    : std::runtime_error(message + " (position: @" + std::to_string(line) + ":" + std::to_string(column) + ")"),
      message_(message),
      line_(line),
      column_(column) {}

Model PomReader::read(std::istream &input) const {
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw std::ios_base::failure("Failed to read POM content");
    }

    pugi::xml_document document;
    // Fragment mode keeps document-level text so document_root can reject it
    pugi::xml_parse_result result =
        document.load_buffer(content.data(), content.size(), pugi::parse_default | pugi::parse_fragment);
    if (!result) {
        auto [line, column] = position_of(content, result.offset);
        throw ParseException(result.description(), line, column);
    }
    check_references(content);

    pugi::xml_node project = document_root(document, content);
    if (std::string(project.name()) != "project") {
        auto [line, column] = position_of(content, project.offset_debug());
        throw ParseException("Expected root element 'project' but found '" + std::string(project.name()) + "'",
                             line, column);
    }

    Model model;
    model.group_id = child_text(project, "groupId");
    model.artifact_id = child_text(project, "artifactId");
    model.version = child_text(project, "version");
    model.packaging = child_text(project, "packaging");
    model.name = child_text(project, "name");
    if (model.packaging.empty()) {
        model.packaging = "jar";
    }

    if (pugi::xml_node parent = project.child("parent")) {
        model.parent = read_parent(parent);
    }

    for (pugi::xml_node module : project.child("modules").children("module")) {
        model.modules.push_back(trim(module.child_value()));
    }

    for (pugi::xml_node dependency : project.child("dependencies").children("dependency")) {
        model.dependencies.push_back(read_dependency(dependency));
    }

    for (pugi::xml_node property : project.child("properties").children()) {
        if (property.type() == pugi::node_element) {
            model.properties[property.name()] = trim(property.child_value());
        }
    }

    spdlog::debug("Read POM {}:{} ({} dependencies, parent: {})",
                  model.group_id, model.artifact_id, model.dependencies.size(),
                  model.parent ? "yes" : "no");

    return model;
}

} // namespace chrysalis::pom
