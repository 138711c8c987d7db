#pragma once

#include "dedup/scan/file_type.hpp"

#include <filesystem>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace dedup::scan {

/**
 * @brief Case-sensitive shell-style wildcard matched against a whole name
 *
 * Supports `*`, `?`, `[abc]`, `[a-z]` and `[!abc]`. An unterminated `[` is a
 * literal bracket.
 */
class GlobPattern {
public:
    explicit GlobPattern(std::string pattern);

    [[nodiscard]] bool matches(const std::string& name) const;

    [[nodiscard]] const std::string& text() const noexcept { return pattern_; }

private:
    static std::string glob_to_regex(const std::string& pattern);

    std::string pattern_;
    bool literal_ = true;  ///< No wildcard characters, compared as a plain string
    std::regex regex_;
};

/**
 * @brief Decides whether a file path is in scope for a scan
 *
 * Two independent tests:
 * - extension allow-list built from FileType categories (empty = allow all)
 * - every ancestor directory name is matched against the exclusion patterns
 *
 * Pure predicate; one instance can serve any number of scans.
 */
class FileFilter {
public:
    /// Version control, dependency, cache and build output directories
    static const std::vector<std::string>& default_exclude_patterns();

    FileFilter();

    /**
     * @param file_types Categories to allow, empty allows every extension
     * @param exclude_dirs Replaces the default patterns when provided
     * @param use_default_excludes Only consulted when exclude_dirs is absent
     */
    explicit FileFilter(std::vector<FileType> file_types,
                        std::optional<std::vector<std::string>> exclude_dirs = std::nullopt,
                        bool use_default_excludes = true);

    [[nodiscard]] bool should_include_file(const std::filesystem::path& path) const;

    /// True when a directory with this name would exclude everything below it
    [[nodiscard]] bool is_excluded_directory(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> filter_files(const std::vector<std::string>& paths) const;

    void add_exclude_pattern(const std::string& pattern);

    void set_file_types(const std::vector<FileType>& file_types);

    /// True when file types or exclusion patterns were given explicitly
    [[nodiscard]] bool is_filtering_active() const noexcept { return explicit_filters_; }

    [[nodiscard]] const std::set<std::string>& allowed_extensions() const noexcept { return allowed_extensions_; }

    [[nodiscard]] std::vector<std::string> exclude_patterns() const;

private:
    bool extension_allowed(const std::filesystem::path& path) const;

    std::set<std::string> allowed_extensions_; // ".txt", ".mp3", ...
    std::vector<GlobPattern> exclude_patterns_;
    bool explicit_filters_ = false;
};

} // namespace dedup::scan
