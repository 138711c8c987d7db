#include "dedup/session.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace fs = std::filesystem;
using dedup::Config;
using dedup::DedupSession;
using dedup::test::set_age;
using dedup::test::write_file;

class DedupSessionTest : public dedup::test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        data_ = root_ / "data";

        write_file(data_ / "a.txt", "Hello, World!");
        write_file(data_ / "nested" / "b.txt", "Hello, World!");
        write_file(data_ / "c.txt", "Hello, Earth!");
        write_file(data_ / ".git" / "d.txt", "Hello, World!");
        write_file(data_ / "unique.txt", "no twin here");

        set_age(data_ / "a.txt", std::chrono::hours(2));
        set_age(data_ / "nested" / "b.txt", std::chrono::hours(1));
    }

    std::string canonical(const fs::path& path) const {
        return fs::canonical(path).string();
    }

    fs::path data_;
};

TEST_F(DedupSessionTest, FindsDuplicatesAndKeepsNewest) {
    DedupSession session{Config{}};
    auto result = session.find(data_);
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    const auto& found = result.value();
    EXPECT_EQ(found.scan.processed, 4u);
    EXPECT_EQ(found.scan.excluded_dirs, 1u);
    EXPECT_EQ(found.hashing.candidates, 3u);
    EXPECT_EQ(found.hashing.unique_sizes, 1u);
    ASSERT_EQ(found.groups.size(), 1u);
    ASSERT_EQ(found.decisions.size(), 1u);

    const auto& decision = found.decisions.front();
    EXPECT_EQ(decision.keep, canonical(data_ / "nested" / "b.txt"));
    EXPECT_EQ(decision.to_delete, std::vector<std::string>{canonical(data_ / "a.txt")});
}

TEST_F(DedupSessionTest, DryRunRemovesNothing) {
    Config config;
    config.removal.dry_run = true;
    DedupSession session(config);

    auto result = session.find(data_);
    ASSERT_TRUE(result.is_ok());
    const auto before = dedup::test::snapshot(root_);

    const auto summary = session.remove(result.value().decisions);

    EXPECT_EQ(summary.success_count, 1u);
    EXPECT_EQ(dedup::test::snapshot(root_), before);
}

TEST_F(DedupSessionTest, LiveRunMovesDuplicatesToConfiguredTrash) {
    Config config;
    config.removal.trash_dir = root_ / "Trash";
    DedupSession session(config);

    auto result = session.find(data_);
    ASSERT_TRUE(result.is_ok());

    const auto summary = session.remove(result.value().decisions);

    EXPECT_EQ(summary.success_count, 1u);
    EXPECT_EQ(summary.failure_count, 0u);
    EXPECT_FALSE(fs::exists(data_ / "a.txt"));
    EXPECT_TRUE(fs::exists(data_ / "nested" / "b.txt"));
    EXPECT_TRUE(fs::exists(root_ / "Trash" / "files" / "a.txt"));
}

TEST_F(DedupSessionTest, ExtensionFilterNarrowsTheScan) {
    write_file(data_ / "song.mp3", "Hello, World!");

    Config config;
    config.scan.file_types = {dedup::scan::FileType::Audio};
    DedupSession session(config);

    auto result = session.find(data_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().scan.processed, 1u);
    EXPECT_TRUE(result.value().groups.empty());
}

TEST_F(DedupSessionTest, MissingRootFails) {
    DedupSession session{Config{}};
    auto result = session.find(root_ / "nope");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, dedup::ErrorKind::InvalidArgument);
}

TEST_F(DedupSessionTest, CacheBelongsToTheSession) {
    DedupSession first{Config{}};
    ASSERT_TRUE(first.find(data_).is_ok());
    EXPECT_EQ(first.cache().size(), 3u);

    DedupSession second{Config{}};
    EXPECT_EQ(second.cache().size(), 0u);
}
