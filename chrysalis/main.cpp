#include "conditions/pom_parent_match.hpp"
#include "utilities/find_files.hpp"
#include "utility/result_report.hpp"
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/raw_ostream.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>

using namespace llvm;
using chrysalis::utility::ExecutionResult;

// Command line options
static cl::OptionCategory ChrysalisCategory("Chrysalis Options");

static cl::SubCommand FindCommand("find", "Find files by name and/or path regular expression");
static cl::SubCommand ParentMatchCommand("parent-match", "Check the parent declared by a POM file");

static cl::opt<std::string> AppRoot(
    cl::Positional,
    cl::desc("<application root>"),
    cl::Required,
    cl::sub(FindCommand),
    cl::sub(ParentMatchCommand),
    cl::cat(ChrysalisCategory));

static cl::opt<std::string> Relative(
    "relative",
    cl::desc("Location relative to the application root"),
    cl::value_desc("path"),
    cl::sub(FindCommand),
    cl::sub(ParentMatchCommand),
    cl::cat(ChrysalisCategory));

static cl::opt<std::string> NameRegex(
    "name-regex",
    cl::desc("Regular expression the file name must match"),
    cl::value_desc("regex"),
    cl::sub(FindCommand),
    cl::cat(ChrysalisCategory));

static cl::opt<std::string> PathRegex(
    "path-regex",
    cl::desc("Regular expression the file folder, relative to the search root, must match (implies --recursive)"),
    cl::value_desc("regex"),
    cl::sub(FindCommand),
    cl::cat(ChrysalisCategory));

static cl::opt<bool> Recursive(
    "recursive",
    cl::desc("Include sub-folders in the search"),
    cl::init(false),
    cl::sub(FindCommand),
    cl::cat(ChrysalisCategory));

static cl::opt<std::string> GroupId(
    "group-id",
    cl::desc("Parent groupId"),
    cl::Required,
    cl::sub(ParentMatchCommand),
    cl::cat(ChrysalisCategory));

static cl::opt<std::string> ArtifactId(
    "artifact-id",
    cl::desc("Parent artifactId"),
    cl::Required,
    cl::sub(ParentMatchCommand),
    cl::cat(ChrysalisCategory));

static cl::opt<std::string> ParentVersion(
    "parent-version",
    cl::desc("Parent version (not compared when omitted)"),
    cl::sub(ParentMatchCommand),
    cl::cat(ChrysalisCategory));

static cl::opt<std::string> OutputFormat(
    "format",
    cl::desc("Output format (json, text)"),
    cl::init("text"),
    cl::sub(FindCommand),
    cl::sub(ParentMatchCommand),
    cl::cat(ChrysalisCategory));

static cl::opt<bool> Verbose(
    "verbose",
    cl::desc("Enable verbose output"),
    cl::init(false),
    cl::sub(FindCommand),
    cl::sub(ParentMatchCommand),
    cl::cat(ChrysalisCategory));

namespace {

int exit_code(const ExecutionResult &result) {
    switch (result.type()) {
        case ExecutionResult::Type::Value:
            return 0;
        case ExecutionResult::Type::Warning:
            return 2;
        case ExecutionResult::Type::Error:
            return 1;
    }
    return 1;
}

} // namespace

int main(int argc, char **argv) {
    InitLLVM X(argc, argv);

    // Parse command line options
    cl::HideUnrelatedOptions(ChrysalisCategory);
    cl::ParseCommandLineOptions(argc, argv, "Chrysalis - transformation inspection utilities\n");

    // Configure spdlog
    if (Verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    if (OutputFormat != "json" && OutputFormat != "text") {
        spdlog::error("Unsupported output format: {}", OutputFormat.getValue());
        return 1;
    }

    try {
        std::filesystem::path app_root(AppRoot.getValue());
        chrysalis::utility::TransformationContext context;
        std::unique_ptr<chrysalis::utility::Utility> utility;

        if (FindCommand) {
            auto find_files = std::make_unique<chrysalis::utilities::FindFiles>();
            if (!NameRegex.empty()) {
                find_files->set_name_regex(NameRegex.getValue());
            }
            find_files->set_recursive(Recursive);
            if (!PathRegex.empty()) {
                find_files->set_path_regex(PathRegex.getValue());
            }
            if (!Relative.empty()) {
                find_files->relative(Relative);
            }
            utility = std::move(find_files);
        } else if (ParentMatchCommand) {
            auto parent_match = std::make_unique<chrysalis::conditions::PomParentMatch>(GroupId, ArtifactId);
            if (!ParentVersion.empty()) {
                parent_match->set_version(ParentVersion.getValue());
            }
            parent_match->relative(Relative.empty() ? "pom.xml" : Relative.getValue());
            utility = std::move(parent_match);
        } else {
            spdlog::error("No command given, expected 'find' or 'parent-match'");
            cl::PrintHelpMessage();
            return 1;
        }

        if (Verbose) {
            spdlog::info("Executing: {}", utility->get_description());
        }

        ExecutionResult result = utility->execution(app_root, context);

        if (OutputFormat == "json") {
            outs() << chrysalis::utility::to_json(result, app_root);
        } else {
            outs() << chrysalis::utility::to_text(result, app_root);
        }

        return exit_code(result);
    } catch (const std::exception& e) {
        spdlog::error("An error occurred: {}", e.what());
        return 1;
    }
}
