#include "utility/result_report.hpp"
#include "utility/utility.hpp"
#include "utils/filesystem.hpp"
#include <cstdio>
#include <sstream>

namespace chrysalis::utility {

std::string json_escape(const std::string &text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(c));
                    escaped += buffer;
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

std::string to_json(const ExecutionResult &result, const std::filesystem::path &app_root) {
    std::ostringstream out;
    out << "{\n"
        << "  \"utility\": \"" << json_escape(result.utility().name()) << "\",\n"
        << "  \"description\": \"" << json_escape(result.utility().get_description()) << "\",\n"
        << "  \"type\": \"" << type_name(result.type()) << "\"";

    if (result.warning_message()) {
        out << ",\n  \"warning\": \"" << json_escape(*result.warning_message()) << "\"";
    }

    if (const auto *exception = result.exception()) {
        out << ",\n  \"error\": \"" << json_escape(exception->what()) << "\"";
        if (exception->cause()) {
            out << ",\n  \"cause\": \"" << json_escape(exception->cause_message()) << "\"";
        }
        const auto &suppressed = exception->suppressed();
        if (!suppressed.empty()) {
            out << ",\n  \"suppressed\": [";
            for (size_t i = 0; i < suppressed.size(); ++i) {
                out << "\n    \"" << json_escape(describe(suppressed[i])) << "\""
                    << (i < suppressed.size() - 1 ? "," : "");
            }
            out << "\n  ]";
        }
    }

    const auto &payload = result.payload();
    if (const auto *match = std::get_if<bool>(&payload)) {
        out << ",\n  \"value\": " << (*match ? "true" : "false");
    } else if (const auto *files = std::get_if<FileList>(&payload)) {
        out << ",\n  \"value\": [";
        for (size_t i = 0; i < files->size(); ++i) {
            out << "\n    \"" << json_escape(utils::relative_path(app_root, (*files)[i])) << "\""
                << (i < files->size() - 1 ? "," : "");
        }
        out << (files->empty() ? "]" : "\n  ]");
    }
    out << "\n}\n";
    return out.str();
}

std::string to_text(const ExecutionResult &result, const std::filesystem::path &app_root) {
    std::ostringstream out;
    out << result.utility().get_description() << "\n"
        << "Result: " << type_name(result.type()) << "\n";

    if (result.warning_message()) {
        out << "Warning: " << *result.warning_message() << "\n";
    }

    if (const auto *exception = result.exception()) {
        out << "Error: " << exception->what() << "\n";
        if (exception->cause()) {
            out << "Cause: " << exception->cause_message() << "\n";
        }
        for (const auto &suppressed : exception->suppressed()) {
            out << "Suppressed: " << describe(suppressed) << "\n";
        }
    }

    const auto &payload = result.payload();
    if (const auto *match = std::get_if<bool>(&payload)) {
        out << "Match: " << (*match ? "yes" : "no") << "\n";
    } else if (const auto *files = std::get_if<FileList>(&payload)) {
        for (const auto &file : *files) {
            out << "  " << utils::relative_path(app_root, file) << "\n";
        }
        out << "Files found: " << files->size() << "\n";
    }
    return out.str();
}

} // namespace chrysalis::utility
