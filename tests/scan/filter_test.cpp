#include "dedup/scan/filter.hpp"

#include <gtest/gtest.h>

using namespace dedup::scan;

TEST(GlobPatternTest, MatchesWholeNameOnly) {
    GlobPattern git(".git");
    EXPECT_TRUE(git.matches(".git"));
    EXPECT_FALSE(git.matches(".github"));
    EXPECT_FALSE(git.matches("my.git.repo"));
}

TEST(GlobPatternTest, Wildcards) {
    GlobPattern egg("*.egg-info");
    EXPECT_TRUE(egg.matches("pkg.egg-info"));
    EXPECT_FALSE(egg.matches("pkg.egg-info.bak"));
    EXPECT_FALSE(egg.matches("pkgXegg-info"));

    GlobPattern single("tmp?");
    EXPECT_TRUE(single.matches("tmp1"));
    EXPECT_FALSE(single.matches("tmp"));
    EXPECT_FALSE(single.matches("tmp12"));
}

TEST(GlobPatternTest, CharacterClasses) {
    GlobPattern digits("v[0-9]");
    EXPECT_TRUE(digits.matches("v7"));
    EXPECT_FALSE(digits.matches("vx"));

    GlobPattern negated("[!.]*");
    EXPECT_TRUE(negated.matches("src"));
    EXPECT_FALSE(negated.matches(".hidden"));

    GlobPattern unterminated("a[b");
    EXPECT_TRUE(unterminated.matches("a[b"));
    EXPECT_FALSE(unterminated.matches("ab"));
}

TEST(GlobPatternTest, WildcardsMatchLineTerminators) {
    GlobPattern egg("*.egg-info");
    EXPECT_TRUE(egg.matches("odd\nname.egg-info"));

    GlobPattern single("tmp?");
    EXPECT_TRUE(single.matches("tmp\r"));
}

TEST(GlobPatternTest, CaseSensitive) {
    GlobPattern modules("node_modules");
    EXPECT_FALSE(modules.matches("Node_Modules"));
}

TEST(FileFilterTest, DefaultsAllowAnyExtension) {
    FileFilter filter;
    EXPECT_TRUE(filter.should_include_file("/data/photos/a.jpg"));
    EXPECT_TRUE(filter.should_include_file("/data/no_extension"));
    EXPECT_FALSE(filter.is_filtering_active());
}

TEST(FileFilterTest, DefaultExcludesRejectAncestors) {
    FileFilter filter;
    EXPECT_FALSE(filter.should_include_file("/repo/.git/objects/readme.txt"));
    EXPECT_FALSE(filter.should_include_file("/repo/web/node_modules/lib/index.js"));
    EXPECT_FALSE(filter.should_include_file("/repo/pkg.egg-info/PKG-INFO"));
    // Only directory names are tested, not the file name
    EXPECT_TRUE(filter.should_include_file("/repo/build"));
}

TEST(FileFilterTest, ExtensionAllowList) {
    FileFilter filter(std::vector<FileType>{FileType::Text});
    EXPECT_TRUE(filter.should_include_file("/docs/notes.TXT"));
    EXPECT_TRUE(filter.should_include_file("/docs/paper.pdf"));
    EXPECT_FALSE(filter.should_include_file("/docs/song.mp3"));
    EXPECT_FALSE(filter.should_include_file("/docs/README"));
    EXPECT_TRUE(filter.is_filtering_active());
}

TEST(FileFilterTest, ExplicitExcludesReplaceDefaults) {
    FileFilter filter({}, std::vector<std::string>{"cache*"});
    EXPECT_TRUE(filter.should_include_file("/repo/.git/config"));
    EXPECT_FALSE(filter.should_include_file("/repo/cache_v2/blob.bin"));
    EXPECT_EQ(filter.exclude_patterns(), std::vector<std::string>{"cache*"});
}

TEST(FileFilterTest, DefaultsCanBeDisabled) {
    FileFilter filter({}, std::nullopt, false);
    EXPECT_TRUE(filter.exclude_patterns().empty());
    EXPECT_TRUE(filter.should_include_file("/repo/.git/config"));
}

TEST(FileFilterTest, AddExcludePatternIgnoresDuplicates) {
    FileFilter filter({}, std::vector<std::string>{});
    filter.add_exclude_pattern("tmp");
    filter.add_exclude_pattern("tmp");
    EXPECT_EQ(filter.exclude_patterns().size(), 1u);
    EXPECT_TRUE(filter.is_excluded_directory("tmp"));
}

TEST(FileFilterTest, FilterFilesKeepsOrder) {
    FileFilter filter(std::vector<FileType>{FileType::Audio});
    const std::vector<std::string> input{"/m/b.mp3", "/m/a.txt", "/m/.git/c.mp3", "/m/a.flac"};
    EXPECT_EQ(filter.filter_files(input), (std::vector<std::string>{"/m/b.mp3", "/m/a.flac"}));
}
