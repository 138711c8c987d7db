#include "dedup/config.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using dedup::ErrorKind;
using json = nlohmann::json;

class ConfigTest : public dedup::test::TempDirTest {};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    dedup::Config config;
    EXPECT_TRUE(config.scan.file_types.empty());
    EXPECT_FALSE(config.scan.exclude_dirs.has_value());
    EXPECT_TRUE(config.scan.use_default_excludes);
    EXPECT_EQ(config.hash.chunk_threshold, 10u * 1024 * 1024);
    EXPECT_EQ(config.hash.chunk_size, 4u * 1024 * 1024);
    EXPECT_EQ(config.hash.workers, 1u);
    EXPECT_EQ(config.keep.tie_break, dedup::resolve::TieBreak::EnumerationOrder);
    EXPECT_FALSE(config.removal.dry_run);
    EXPECT_EQ(config.log.level, "info");
}

TEST_F(ConfigTest, LoadsPartialDocumentOverDefaults) {
    const auto path = root_ / "dedup.json";
    dedup::test::write_file(path, R"({
        "scan": {"file_types": ["Text", "audio"], "exclude_dirs": ["cache*"]},
        "hash": {"workers": 4},
        "keep": {"tie_break": "lexicographic"},
        "delete": {"dry_run": true, "trash_dir": "/tmp/trash"}
    })");

    auto loaded = dedup::load_config(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().describe();
    const auto& config = loaded.value();

    ASSERT_EQ(config.scan.file_types.size(), 2u);
    EXPECT_EQ(config.scan.file_types[0], dedup::scan::FileType::Text);
    EXPECT_EQ(config.scan.file_types[1], dedup::scan::FileType::Audio);
    ASSERT_TRUE(config.scan.exclude_dirs.has_value());
    EXPECT_EQ(config.scan.exclude_dirs->front(), "cache*");
    EXPECT_EQ(config.hash.workers, 4u);
    EXPECT_EQ(config.hash.chunk_size, 4u * 1024 * 1024);
    EXPECT_EQ(config.keep.tie_break, dedup::resolve::TieBreak::Lexicographic);
    EXPECT_TRUE(config.removal.dry_run);
    ASSERT_TRUE(config.removal.trash_dir.has_value());
    EXPECT_EQ(config.removal.trash_dir->string(), "/tmp/trash");
    EXPECT_EQ(config.log.level, "info");
}

TEST_F(ConfigTest, RejectsUnknownFileType) {
    auto result = dedup::config_from_json(json{{"scan", {{"file_types", {"images"}}}}});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(ConfigTest, RejectsWrongValueTypes) {
    auto result = dedup::config_from_json(json{{"hash", {{"workers", "many"}}}});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(ConfigTest, MalformedFileIsInvalidArgument) {
    const auto path = root_ / "broken.json";
    dedup::test::write_file(path, "{ not json");

    auto result = dedup::load_config(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(ConfigTest, MissingFileIsNotFound) {
    auto result = dedup::load_config(root_ / "absent.json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST_F(ConfigTest, EffectiveConfigRoundTripsThroughJson) {
    dedup::Config config;
    config.scan.file_types = {dedup::scan::FileType::Video};
    config.hash.workers = 3;
    config.keep.tie_break = dedup::resolve::TieBreak::Lexicographic;

    auto reloaded = dedup::config_from_json(dedup::config_to_json(config));
    ASSERT_TRUE(reloaded.is_ok());
    EXPECT_EQ(reloaded.value().scan.file_types, config.scan.file_types);
    EXPECT_EQ(reloaded.value().hash.workers, 3u);
    EXPECT_EQ(reloaded.value().keep.tie_break, dedup::resolve::TieBreak::Lexicographic);
}
