#include "conditions/pom_parent_match.hpp"
#include "pom/pom_reader.hpp"
#include "utility/validation.hpp"
#include "utils/filesystem.hpp"
#include <ios>
#include <memory>
#include <spdlog/spdlog.h>

namespace chrysalis::conditions {

namespace fs = std::filesystem;
using utility::ExecutionResult;
using utility::UtilityException;

PomParentMatch::PomParentMatch() : utility::Utility("PomParentMatch") {}

PomParentMatch::PomParentMatch(const std::string &group_id, const std::string &artifact_id) : PomParentMatch() {
    set_group_id(group_id);
    set_artifact_id(artifact_id);
}

PomParentMatch::PomParentMatch(const std::string &group_id, const std::string &artifact_id,
                               const std::string &version)
    : PomParentMatch(group_id, artifact_id) {
    set_version(version);
}

PomParentMatch &PomParentMatch::set_group_id(const std::string &group_id) {
    utility::check_for_blank_string("GroupId", group_id);
    group_id_ = group_id;
    return *this;
}

PomParentMatch &PomParentMatch::set_artifact_id(const std::string &artifact_id) {
    utility::check_for_blank_string("ArtifactId", artifact_id);
    artifact_id_ = artifact_id;
    return *this;
}

PomParentMatch &PomParentMatch::set_version(const std::optional<std::string> &version) {
    utility::check_for_empty_string("Version", version);
    version_ = version;
    return *this;
}

PomParentMatch &PomParentMatch::relative(const std::string &relative_path) {
    location_.set_relative(relative_path);
    return *this;
}

PomParentMatch &PomParentMatch::absolute(const std::string &attribute, const std::string &relative_path) {
    location_.set_absolute(attribute, relative_path);
    return *this;
}

PomParentMatch &PomParentMatch::set_stream_opener(pom::PomStreamOpener opener) {
    stream_opener_ = opener ? std::move(opener) : pom::PomStreamOpener(pom::open_pom_file);
    return *this;
}

std::string PomParentMatch::coordinates() const {
    return group_id_ + ":" + artifact_id_ + (version_ ? ":" + *version_ : "");
}

std::string PomParentMatch::get_description() const {
    return "Check if the pom has a parent matching '" + coordinates() + "' exists in a POM file";
}

ExecutionResult PomParentMatch::execution(const fs::path &app_root,
                                          const utility::TransformationContext &context) const {
    if (group_id_.empty() || artifact_id_.empty()) {
        return ExecutionResult::error(*this, UtilityException(name() + " requires both groupId and artifactId"));
    }

    fs::path file;
    try {
        file = location_.resolve(app_root, context);
    } catch (const UtilityException &e) {
        spdlog::error("{}: {}", name(), e.what());
        return ExecutionResult::error(*this, e);
    }

    const std::string pom_file = utils::relative_path(app_root, file);
    std::optional<UtilityException> failure;
    bool exists = false;

    std::unique_ptr<pom::PomStream> stream;
    try {
        stream = stream_opener_(file);
        if (!stream) {
            throw std::ios_base::failure("Unable to open " + file.string());
        }

        pom::Model model = pom::PomReader().read(stream->input());
        if (model.parent) {
            const pom::Parent &parent = *model.parent;
            exists = parent.group_id == group_id_ && parent.artifact_id == artifact_id_ &&
                     (!version_ || *version_ == parent.version);
        }
    } catch (const std::exception &) {
        failure.emplace("Exception happened when checking if POM parent " + coordinates() + " exists in " + pom_file,
                        std::current_exception());
    }

    if (stream) {
        try {
            stream->close();
        } catch (const std::exception &) {
            if (failure) {
                failure->add_suppressed(std::current_exception());
            } else {
                failure.emplace("Exception happened when closing pom file " + pom_file, std::current_exception());
            }
        }
    }

    if (failure) {
        spdlog::error("{}: {}: {}", name(), failure->what(), failure->cause_message());
        return ExecutionResult::error(*this, *failure);
    }

    spdlog::debug("{}: parent {} {} in {}", name(), coordinates(), exists ? "found" : "not found", pom_file);
    return ExecutionResult::value(*this, exists);
}

} // namespace chrysalis::conditions
