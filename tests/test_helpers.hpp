#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>

namespace dedup::test {

namespace fs = std::filesystem;

inline fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = static_cast<uint64_t>(timestamp) ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("dedup_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

/// Shift a file's mtime relative to now
inline void set_age(const fs::path& path, std::chrono::seconds age) {
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}

/// path (relative) -> contents, for before/after comparisons
inline std::map<std::string, std::string> snapshot(const fs::path& root) {
    std::map<std::string, std::string> entries;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        const auto relative = fs::relative(entry.path(), root).generic_string();
        entries[relative] = entry.is_regular_file() ? read_file(entry.path()) : std::string("<dir>");
    }
    return entries;
}

/// Fixture owning a fresh temp directory per test
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
    }

    void TearDown() override {
        if (!root_.empty()) {
            std::error_code ec;
            fs::permissions(root_, fs::perms::owner_all, fs::perm_options::add, ec);
            fs::remove_all(root_, ec);
        }
    }

    fs::path root_;
};

} // namespace dedup::test
