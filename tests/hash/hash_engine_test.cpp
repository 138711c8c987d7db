#include "dedup/events/events.hpp"
#include "dedup/hash/hash_engine.hpp"
#include "dedup/hash/sha256.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <algorithm>
#include <mutex>

namespace fs = std::filesystem;
using dedup::ErrorKind;
using dedup::FileRecord;
using dedup::hash::HashCache;
using dedup::hash::HashEngine;
using dedup::hash::HashOptions;
using dedup::hash::Sha256;
using dedup::test::write_file;

class HashEngineTest : public dedup::test::TempDirTest {
protected:
    FileRecord make_record(const std::string& name, const std::string& content, double mtime = 0.0) {
        const auto path = root_ / name;
        write_file(path, content);
        FileRecord record;
        record.path = path.string();
        record.size = content.size();
        record.mtime = mtime;
        return record;
    }

    HashCache cache_;
};

TEST_F(HashEngineTest, DigestMatchesKnownSha256) {
    write_file(root_ / "hello.txt", "Hello, World!");
    HashEngine engine(cache_);

    auto result = engine.digest((root_ / "hello.txt").string());
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value(), "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
}

TEST_F(HashEngineTest, EmptyFileHasEmptyDigest) {
    write_file(root_ / "empty", "");
    HashEngine engine(cache_);

    auto result = engine.digest((root_ / "empty").string());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), Sha256::hex_digest("").value());
}

TEST_F(HashEngineTest, ChunkedAndWholeReadsAgree) {
    std::string content;
    for (int i = 0; i < 1000; ++i) {
        content += static_cast<char>(i * 31 % 251);
    }
    write_file(root_ / "data.bin", content);
    const auto path = (root_ / "data.bin").string();

    HashCache whole_cache;
    HashEngine whole(whole_cache);

    HashCache chunked_cache;
    HashOptions options;
    options.chunk_threshold = 16;
    options.chunk_size = 7;
    HashEngine chunked(chunked_cache, options);

    auto expected = Sha256::hex_digest(content);
    ASSERT_TRUE(expected.is_ok());
    EXPECT_EQ(whole.digest(path).value(), expected.value());
    EXPECT_EQ(chunked.digest(path).value(), expected.value());
}

TEST_F(HashEngineTest, FileAboveThresholdUsesChunkedPath) {
    // 10 MiB + a tail that does not fill a whole chunk
    std::string content(10 * 1024 * 1024 + 4099, '\0');
    for (size_t i = 0; i < content.size(); i += 4096) {
        content[i] = static_cast<char>(i / 4096);
    }
    write_file(root_ / "large.bin", content);

    HashEngine engine(cache_);
    auto result = engine.digest((root_ / "large.bin").string());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), Sha256::hex_digest(content).value());
}

TEST_F(HashEngineTest, DigestErrors) {
    HashEngine engine(cache_);

    auto missing = engine.digest((root_ / "missing.txt").string());
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);

    fs::create_directory(root_ / "dir");
    auto directory = engine.digest((root_ / "dir").string());
    ASSERT_TRUE(directory.is_error());
    EXPECT_EQ(directory.error().kind, ErrorKind::PathKindMismatch);
}

TEST_F(HashEngineTest, UnreadableFileIsPermissionDenied) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    write_file(root_ / "locked.txt", "secret");
    fs::permissions(root_ / "locked.txt", fs::perms::none);

    HashEngine engine(cache_);
    auto result = engine.digest((root_ / "locked.txt").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::PermissionDenied);
}

TEST_F(HashEngineTest, CacheReturnsFirstDigestUntilCleared) {
    const auto path = (root_ / "mutable.txt").string();
    write_file(path, "before");

    HashEngine engine(cache_);
    const auto first = engine.digest(path).value();
    EXPECT_TRUE(cache_.contains(path));

    write_file(path, "after!");
    EXPECT_EQ(engine.digest(path).value(), first);

    engine.clear_cache();
    EXPECT_EQ(engine.digest(path).value(), Sha256::hex_digest("after!").value());
}

TEST_F(HashEngineTest, GroupsIdenticalContent) {
    std::vector<FileRecord> records{
        make_record("a.txt", "Hello, World!", 100.0),
        make_record("b.txt", "Hello, World!", 200.0),
        make_record("c.txt", "something else"),
    };

    HashEngine engine(cache_);
    auto groups = engine.find_duplicates(records);

    ASSERT_EQ(groups.size(), 1u);
    const auto& group = groups.begin()->second;
    EXPECT_EQ(group.fingerprint, groups.begin()->first);
    EXPECT_EQ(group.size, 13u);
    ASSERT_EQ(group.members.size(), 2u);
    EXPECT_EQ(group.members[0].path, records[0].path);
    EXPECT_EQ(group.members[1].path, records[1].path);
}

TEST_F(HashEngineTest, EqualSizeDifferentContentIsNotDuplicate) {
    std::vector<FileRecord> records{
        make_record("x.txt", "0123456789"),
        make_record("y.txt", "abcdefghij"),
    };

    HashEngine engine(cache_);
    auto groups = engine.find_duplicates(records);

    EXPECT_TRUE(groups.empty());
    EXPECT_EQ(engine.last_stats().candidates, 2u);
    EXPECT_EQ(engine.last_stats().hashed, 2u);
}

TEST_F(HashEngineTest, UniqueSizesAreNeverHashed) {
    std::vector<FileRecord> records{
        make_record("one.txt", "1"),
        make_record("two.txt", "22"),
        make_record("three.txt", "333"),
    };

    HashEngine engine(cache_);
    auto groups = engine.find_duplicates(records);

    EXPECT_TRUE(groups.empty());
    EXPECT_EQ(engine.last_stats().unique_sizes, 3u);
    EXPECT_EQ(engine.last_stats().hashed, 0u);
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(HashEngineTest, VanishedFileIsSkippedAndCounted) {
    std::vector<FileRecord> records{
        make_record("a.txt", "same"),
        make_record("b.txt", "same"),
        make_record("c.txt", "same"),
    };
    fs::remove(records[2].path);

    dedup::events::EventBus bus;
    std::vector<std::string> skipped;
    bus.subscribe<dedup::events::EntrySkippedEvent>([&](const dedup::events::EntrySkippedEvent& e) {
        skipped.push_back(e.path);
    });

    HashEngine engine(cache_, HashOptions{}, &bus);
    auto groups = engine.find_duplicates(records);

    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups.begin()->second.members.size(), 2u);
    EXPECT_EQ(engine.last_stats().failures, 1u);
    EXPECT_EQ(skipped, std::vector<std::string>{records[2].path});
}

TEST_F(HashEngineTest, ProgressIsMonotonicAndEndsAtHundred) {
    std::vector<FileRecord> records;
    for (int i = 0; i < 7; ++i) {
        records.push_back(make_record("f" + std::to_string(i) + ".txt", i % 2 ? "odd" : "eve"));
    }

    std::vector<int> percents;
    HashEngine engine(cache_);
    engine.find_duplicates(records, [&percents](int percent) { percents.push_back(percent); });

    ASSERT_EQ(percents.size(), 7u);
    EXPECT_TRUE(std::is_sorted(percents.begin(), percents.end()));
    EXPECT_EQ(percents.front(), 14);
    EXPECT_EQ(percents.back(), 100);
}

TEST_F(HashEngineTest, ProgressCountsOnlySizeBucketCandidates) {
    std::vector<FileRecord> records{
        make_record("a.txt", "aaa"),
        make_record("unique1.txt", "1"),
        make_record("b.txt", "aaa"),
        make_record("unique2.txt", "22"),
        make_record("c.txt", "ccc"),
        make_record("unique3.txt", "4444"),
        make_record("d.txt", "ddd"),
    };

    dedup::events::EventBus bus;
    std::vector<std::size_t> totals;
    bus.subscribe<dedup::events::HashProgressEvent>([&](const dedup::events::HashProgressEvent& e) {
        totals.push_back(e.total);
    });

    std::vector<int> percents;
    HashEngine engine(cache_, HashOptions{}, &bus);
    auto groups = engine.find_duplicates(records, [&percents](int percent) { percents.push_back(percent); });

    EXPECT_EQ(engine.last_stats().candidates, 4u);
    EXPECT_EQ(engine.last_stats().unique_sizes, 3u);
    EXPECT_EQ(groups.size(), 1u);

    ASSERT_EQ(percents.size(), engine.last_stats().candidates);
    EXPECT_EQ(percents, (std::vector<int>{25, 50, 75, 100}));
    EXPECT_EQ(totals, (std::vector<std::size_t>(4, 4u)));
}

TEST_F(HashEngineTest, ParallelHashingMatchesSequential) {
    std::vector<FileRecord> records;
    for (int i = 0; i < 40; ++i) {
        records.push_back(make_record("f" + std::to_string(i) + ".dat", "content-" + std::to_string(i % 5)));
    }

    HashEngine sequential(cache_);
    const auto expected = sequential.find_duplicates(records);

    HashCache parallel_cache;
    HashOptions options;
    options.workers = 4;
    HashEngine parallel(parallel_cache, options);

    std::mutex mutex;
    std::vector<int> percents;
    const auto actual = parallel.find_duplicates(records, [&](int percent) {
        std::lock_guard lock(mutex);
        percents.push_back(percent);
    });

    ASSERT_EQ(actual.size(), expected.size());
    for (const auto& [fingerprint, group] : expected) {
        auto it = actual.find(fingerprint);
        ASSERT_NE(it, actual.end());
        ASSERT_EQ(it->second.members.size(), group.members.size());
        for (size_t i = 0; i < group.members.size(); ++i) {
            EXPECT_EQ(it->second.members[i].path, group.members[i].path);
        }
    }

    ASSERT_EQ(percents.size(), records.size());
    EXPECT_TRUE(std::is_sorted(percents.begin(), percents.end()));
    EXPECT_EQ(percents.back(), 100);
}

TEST_F(HashEngineTest, EmitsGroupFoundEvents) {
    std::vector<FileRecord> records{
        make_record("a.txt", "dup"),
        make_record("b.txt", "dup"),
        make_record("c.txt", "dup"),
    };

    dedup::events::EventBus bus;
    std::size_t members = 0;
    bus.subscribe<dedup::events::DuplicateGroupFoundEvent>(
        [&](const dedup::events::DuplicateGroupFoundEvent& e) { members = e.member_count; });

    HashEngine engine(cache_, HashOptions{}, &bus);
    engine.find_duplicates(records);

    EXPECT_EQ(members, 3u);
}
