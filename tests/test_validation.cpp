#include "utility/exceptions.hpp"
#include "utility/validation.hpp"
#include <gtest/gtest.h>

using namespace chrysalis::utility;

TEST(ValidationTest, BlankStringsAreRejected) {
    EXPECT_THROW(check_for_blank_string("GroupId", ""), ConfigurationException);
    EXPECT_THROW(check_for_blank_string("GroupId", "  \t"), ConfigurationException);
    EXPECT_NO_THROW(check_for_blank_string("GroupId", "com.test"));
}

TEST(ValidationTest, BlankMessageNamesTheParameter) {
    try {
        check_for_blank_string("ArtifactId", " ");
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException &e) {
        EXPECT_STREQ(e.what(), "ArtifactId cannot be blank");
    }
}

TEST(ValidationTest, EmptyStringRejectedButAbsentAllowed) {
    EXPECT_THROW(check_for_empty_string("Version", std::string()), ConfigurationException);
    EXPECT_NO_THROW(check_for_empty_string("Version", std::nullopt));
    EXPECT_NO_THROW(check_for_empty_string("Version", std::string(" ")));
}

TEST(ValidationTest, InvalidRegexIsRejected) {
    EXPECT_THROW(check_for_valid_regex("Name regex", "(unclosed"), ConfigurationException);
    EXPECT_NO_THROW(check_for_valid_regex("Name regex", ".*\\.txt"));
}
