#include "dedup/scan/file_type.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace dedup::scan;

TEST(FileTypeTest, ExtensionLookupIgnoresCaseAndDot) {
    EXPECT_EQ(get_type("pdf"), FileType::Text);
    EXPECT_EQ(get_type(".PDF"), FileType::Text);
    EXPECT_EQ(get_type(".Mp3"), FileType::Audio);
    EXPECT_EQ(get_type("mkv"), FileType::Video);
    EXPECT_EQ(get_type(".7z"), FileType::Archive);
    EXPECT_EQ(get_type(".exe"), FileType::Unknown);
    EXPECT_EQ(get_type(""), FileType::Unknown);
}

TEST(FileTypeTest, SupportedExtensionsAreSortedWithDots) {
    const auto extensions = supported_extensions(FileType::Audio);
    ASSERT_FALSE(extensions.empty());
    EXPECT_TRUE(std::is_sorted(extensions.begin(), extensions.end()));
    for (const auto& ext : extensions) {
        EXPECT_EQ(ext.front(), '.');
        EXPECT_EQ(get_type(ext), FileType::Audio);
    }
    EXPECT_TRUE(supported_extensions(FileType::Unknown).empty());
}

TEST(FileTypeTest, ParsesCategoryNames) {
    EXPECT_EQ(parse_file_type("text"), FileType::Text);
    EXPECT_EQ(parse_file_type("VIDEO"), FileType::Video);
    EXPECT_FALSE(parse_file_type("unknown").has_value());
    EXPECT_FALSE(parse_file_type("images").has_value());
    EXPECT_STREQ(to_string(FileType::Archive), "archive");
}

TEST(FileTypeTest, IsSupported) {
    EXPECT_TRUE(is_supported(".txt"));
    EXPECT_FALSE(is_supported(".cpp"));
}
