#ifndef CHRYSALIS_CONDITIONS_POM_PARENT_MATCH_HPP
#define CHRYSALIS_CONDITIONS_POM_PARENT_MATCH_HPP

#pragma once

#include "pom/pom_stream.hpp"
#include "utility/utility.hpp"
#include <optional>
#include <string>

namespace chrysalis::conditions {

// Checks whether a POM file declares a parent matching groupId and
// artifactId, and version too when one is set. The result value is a bool.
class PomParentMatch : public utility::Utility {
public:
    PomParentMatch();
    PomParentMatch(const std::string &group_id, const std::string &artifact_id);
    PomParentMatch(const std::string &group_id, const std::string &artifact_id, const std::string &version);

    PomParentMatch &set_group_id(const std::string &group_id);
    PomParentMatch &set_artifact_id(const std::string &artifact_id);
    PomParentMatch &set_version(const std::optional<std::string> &version);

    PomParentMatch &relative(const std::string &relative_path);
    PomParentMatch &absolute(const std::string &attribute, const std::string &relative_path = "");

    const std::string &group_id() const { return group_id_; }
    const std::string &artifact_id() const { return artifact_id_; }
    const std::optional<std::string> &version() const { return version_; }

    // Where the POM bytes come from; defaults to pom::open_pom_file
    PomParentMatch &set_stream_opener(pom::PomStreamOpener opener);

    // groupId:artifactId[:version]
    std::string coordinates() const;

    std::string get_description() const override;
    utility::ExecutionResult execution(const std::filesystem::path &app_root,
                                       const utility::TransformationContext &context) const override;

private:
    std::string group_id_;
    std::string artifact_id_;
    std::optional<std::string> version_;
    pom::PomStreamOpener stream_opener_ {pom::open_pom_file};
};

} // namespace chrysalis::conditions

#endif // CHRYSALIS_CONDITIONS_POM_PARENT_MATCH_HPP
