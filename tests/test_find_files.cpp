#include "test_helpers.hpp"
#include "utilities/find_files.hpp"
#include "utility/exceptions.hpp"
#include "utils/filesystem.hpp"
#include <algorithm>
#include <regex>
#include <vector>

using namespace chrysalis;
using utilities::FindFiles;
using utility::ExecutionResult;

class FindFilesTest : public test::TempTree {
protected:
    std::vector<std::string> relative_names(const ExecutionResult &result) const {
        std::vector<std::string> names;
        for (const auto &file : result.value<utility::FileList>()) {
            names.push_back(utils::relative_path(root_, file));
        }
        return names;
    }

    void write_sample_tree() {
        write_file("a.txt");
        write_file("b.log");
        write_file("sub/c.txt");
    }

    utility::TransformationContext context_;
};

TEST_F(FindFilesTest, NameRegexNonRecursive) {
    write_sample_tree();

    FindFiles find_files(".*\\.txt", false);
    auto result = find_files.execution(root_, context_);

    ASSERT_EQ(result.type(), ExecutionResult::Type::Value);
    EXPECT_EQ(relative_names(result), std::vector<std::string>({"a.txt"}));
    EXPECT_EQ(&result.utility(), &find_files);
}

TEST_F(FindFilesTest, NameRegexRecursive) {
    write_sample_tree();

    FindFiles find_files(".*\\.txt", true);
    auto result = find_files.execution(root_, context_);

    ASSERT_EQ(result.type(), ExecutionResult::Type::Value);
    EXPECT_EQ(relative_names(result), std::vector<std::string>({"a.txt", "sub/c.txt"}));
}

TEST_F(FindFilesTest, PathRegexForcesRecursion) {
    write_sample_tree();

    FindFiles find_files;
    find_files.set_path_regex(std::string("sub"));
    EXPECT_TRUE(find_files.is_recursive());

    auto result = find_files.execution(root_, context_);
    ASSERT_EQ(result.type(), ExecutionResult::Type::Value);
    EXPECT_EQ(relative_names(result), std::vector<std::string>({"sub/c.txt"}));
}

TEST_F(FindFilesTest, NameMatchIsFullMatch) {
    write_file("pom.xml");
    write_file("pom.xml.bak");

    auto result = FindFiles("pom\\.xml", false).execution(root_, context_);

    ASSERT_EQ(result.type(), ExecutionResult::Type::Value);
    EXPECT_EQ(relative_names(result), std::vector<std::string>({"pom.xml"}));
}

TEST_F(FindFilesTest, PathRegexUsesForwardSlashesFromSearchRoot) {
    write_file("src/main/java/App.java");
    write_file("src/test/java/AppTest.java");
    write_file("src/main/resources/app.properties");

    FindFiles find_files(".*\\.java", "src/main/.*");
    auto result = find_files.execution(root_, context_);

    ASSERT_EQ(result.type(), ExecutionResult::Type::Value);
    EXPECT_EQ(relative_names(result), std::vector<std::string>({"src/main/java/App.java"}));
}

TEST_F(FindFilesTest, EveryReturnedFileSatisfiesBothFilters) {
    write_file("a/x.txt");
    write_file("a/y.log");
    write_file("a/b/z.txt");
    write_file("c/x.txt");
    write_file("top.txt");

    const std::string name_regex = "[xz]\\.txt";
    const std::string path_regex = "a(/b)?";
    auto result = FindFiles(name_regex, path_regex).execution(root_, context_);
    ASSERT_EQ(result.type(), ExecutionResult::Type::Value);

    const auto &files = result.value<utility::FileList>();
    for (const auto &file : files) {
        EXPECT_TRUE(std::regex_match(file.filename().string(), std::regex(name_regex)));
        EXPECT_TRUE(std::regex_match(utils::relative_path(root_, file.parent_path()), std::regex(path_regex)));
    }
    EXPECT_EQ(relative_names(result), std::vector<std::string>({"a/b/z.txt", "a/x.txt"}));
}

TEST_F(FindFilesTest, SearchRootCanBeNarrowed) {
    write_file("a.txt");
    write_file("module/b.txt");
    write_file("module/nested/c.txt");

    FindFiles find_files(".*\\.txt", true);
    find_files.relative("module");
    auto result = find_files.execution(root_, context_);

    ASSERT_EQ(result.type(), ExecutionResult::Type::Value);
    EXPECT_EQ(relative_names(result), std::vector<std::string>({"module/b.txt", "module/nested/c.txt"}));
}

TEST_F(FindFilesTest, PathRegexIsRelativeToSearchRoot) {
    write_file("module/nested/c.txt");
    write_file("module/other/d.txt");

    FindFiles find_files;
    find_files.set_path_regex(std::string("nested")).relative("module");
    auto result = find_files.execution(root_, context_);

    ASSERT_EQ(result.type(), ExecutionResult::Type::Value);
    EXPECT_EQ(relative_names(result), std::vector<std::string>({"module/nested/c.txt"}));
}

TEST_F(FindFilesTest, AbsoluteSearchRootFromContext) {
    write_file("elsewhere/x.txt");
    context_.set("otherFolder", root_ / "elsewhere");

    FindFiles find_files;
    find_files.absolute("otherFolder");
    auto result = find_files.execution(root_, context_);

    ASSERT_EQ(result.type(), ExecutionResult::Type::Value);
    EXPECT_EQ(relative_names(result), std::vector<std::string>({"elsewhere/x.txt"}));
}

TEST_F(FindFilesTest, EmptyFolderGivesWarning) {
    FindFiles find_files(".*", true);
    auto result = find_files.execution(root_, context_);

    ASSERT_EQ(result.type(), ExecutionResult::Type::Warning);
    EXPECT_EQ(*result.warning_message(), "No files have been found");
    EXPECT_TRUE(result.value<utility::FileList>().empty());
}

TEST_F(FindFilesTest, FoldersAreNeverMatched) {
    make_folder("docs.txt");

    auto result = FindFiles(".*\\.txt", true).execution(root_, context_);
    ASSERT_EQ(result.type(), ExecutionResult::Type::Warning);
}

TEST_F(FindFilesTest, RepeatedExecutionIsStable) {
    write_sample_tree();
    FindFiles find_files(".*", true);

    auto first = find_files.execution(root_, context_);
    auto second = find_files.execution(root_, context_);

    EXPECT_EQ(first.type(), second.type());
    EXPECT_EQ(relative_names(first), relative_names(second));
}

TEST_F(FindFilesTest, MissingSearchRootIsError) {
    FindFiles find_files;
    find_files.relative("does/not/exist");
    auto result = find_files.execution(root_, context_);

    ASSERT_EQ(result.type(), ExecutionResult::Type::Error);
    ASSERT_NE(result.exception(), nullptr);
    EXPECT_NE(std::string(result.exception()->what()).find("does/not/exist"), std::string::npos);
}

TEST_F(FindFilesTest, WalkErrorFailsTheWholeSearch) {
    write_file("a.txt");
    write_file("sub/b.txt");
    // Self-referencing link: resolving it fails with ELOOP mid-walk
    std::filesystem::create_symlink("loop", root_ / "sub" / "loop");

    auto result = FindFiles(".*", true).execution(root_, context_);

    ASSERT_EQ(result.type(), ExecutionResult::Type::Error);
    EXPECT_FALSE(result.has_value());
    ASSERT_NE(result.exception(), nullptr);
    EXPECT_STREQ(result.exception()->what(), "Exception happened when searching for files under .");
    EXPECT_THROW(std::rethrow_exception(result.exception()->cause()), std::filesystem::filesystem_error);
}

TEST_F(FindFilesTest, MissingContextAttributeIsError) {
    FindFiles find_files;
    find_files.absolute("unknown");
    auto result = find_files.execution(root_, context_);

    ASSERT_EQ(result.type(), ExecutionResult::Type::Error);
    EXPECT_FALSE(result.has_value());
}

TEST(FindFilesConfigTest, RecursiveFalseClearsPathRegex) {
    FindFiles find_files(".*", "src/.*");
    ASSERT_TRUE(find_files.path_regex().has_value());
    EXPECT_TRUE(find_files.is_recursive());

    find_files.set_recursive(false);
    EXPECT_FALSE(find_files.path_regex().has_value());
    EXPECT_FALSE(find_files.is_recursive());

    find_files.set_recursive(true).set_path_regex(std::string("x"));
    find_files.set_recursive(false);
    EXPECT_FALSE(find_files.path_regex().has_value());
}

TEST(FindFilesConfigTest, PathRegexAlwaysLeavesRecursiveOn) {
    FindFiles find_files;
    find_files.set_recursive(false).set_path_regex(std::string("a"));
    EXPECT_TRUE(find_files.is_recursive());

    find_files.set_path_regex(std::nullopt);
    EXPECT_FALSE(find_files.path_regex().has_value());
    EXPECT_TRUE(find_files.is_recursive());
}

TEST(FindFilesConfigTest, InvalidConfigurationFailsImmediately) {
    FindFiles find_files;
    EXPECT_THROW(find_files.set_name_regex(std::string()), utility::ConfigurationException);
    EXPECT_THROW(find_files.set_path_regex(std::string()), utility::ConfigurationException);
    EXPECT_THROW(find_files.set_name_regex(std::string("[unclosed")), utility::ConfigurationException);
    EXPECT_THROW(FindFiles("", true), utility::ConfigurationException);
    EXPECT_FALSE(find_files.name_regex().has_value());
}

TEST(FindFilesConfigTest, Description) {
    EXPECT_EQ(FindFiles(".*", false).get_description(),
              "Find files whose name and/or path match regular expression and are under the root folder "
              "only (not including sub-folders)");

    FindFiles recursive(".*", true);
    recursive.relative("src/main");
    EXPECT_EQ(recursive.get_description(),
              "Find files whose name and/or path match regular expression and are under src/main and sub-folders");

    FindFiles dot(".*", true);
    dot.relative(".");
    EXPECT_EQ(dot.get_description(),
              "Find files whose name and/or path match regular expression and are under the root folder "
              "and sub-folders");
}
