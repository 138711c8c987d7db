#pragma once

#include "dedup/core/result.hpp"
#include "dedup/core/types.hpp"
#include "dedup/events/event_bus.hpp"
#include "dedup/events/events.hpp"
#include "dedup/scan/filter.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dedup::scan {

/**
 * @brief Scan settings loaded from configuration
 */
struct ScanOptions {
    std::vector<FileType> file_types;                        ///< Empty = every extension
    std::optional<std::vector<std::string>> exclude_dirs;    ///< Replaces the defaults when set
    bool use_default_excludes = true;
    bool estimate_total = true;                              ///< Pre-walk to size progress updates

    FileFilter make_filter() const;
};

/**
 * @brief Receives records as the walk produces them
 *
 * Return false to stop the walk early.
 */
using RecordSink = std::function<bool(const FileRecord&)>;

/**
 * @brief Walks a directory tree and emits one FileRecord per in-scope regular file
 *
 * - Symlinks are counted and never followed
 * - Files rejected by the filter are counted, not emitted
 * - Per-entry I/O errors are counted and the walk continues
 * - Failing to open the root aborts the scan
 *
 * Each scan() call walks the tree again from scratch; records are streamed to
 * the sink, never accumulated.
 */
class DirectoryScanner {
public:
    static constexpr std::size_t kProgressEveryFiles = 100;
    static constexpr std::chrono::seconds kProgressInterval{1};

    explicit DirectoryScanner(FileFilter filter = FileFilter(),
                              events::EventBus* bus = nullptr,
                              bool estimate_total = true);

    DirectoryScanner(const ScanOptions& options, events::EventBus* bus = nullptr);

    /**
     * @brief Walk root and push every in-scope regular file to sink
     *
     * Fails with InvalidArgument when root is missing or not a directory, or
     * with the classified error when root cannot be listed.
     */
    Result<ScanSummary> scan(const std::filesystem::path& root, const RecordSink& sink);

    /// scan() into a vector
    Result<std::vector<FileRecord>> collect(const std::filesystem::path& root);

    /**
     * @brief Count regular files below root without following symlinks
     *
     * Unreadable directories are skipped silently; this only sizes progress.
     */
    static std::size_t estimate_total(const std::filesystem::path& root);

    [[nodiscard]] const FileFilter& filter() const noexcept { return filter_; }

    /// Summary of the most recent scan()
    [[nodiscard]] const ScanSummary& last_summary() const noexcept { return summary_; }

private:
    /// Visit one listing; subdirectories are appended to pending. False = sink asked to stop
    bool walk_directory(const std::filesystem::path& dir,
                        std::filesystem::directory_iterator it,
                        std::vector<std::filesystem::path>& pending,
                        const RecordSink& sink);

    bool visit_entry(const std::filesystem::directory_entry& entry,
                     const std::filesystem::path& dir,
                     std::vector<std::filesystem::path>& subdirs,
                     const RecordSink& sink);

    double to_epoch_seconds(std::filesystem::file_time_type time) const;

    void skip(const std::filesystem::path& path,
              events::EntrySkippedEvent::Reason reason,
              std::optional<Error> error = std::nullopt);

    void report_progress(const std::filesystem::path& current_dir);

    FileFilter filter_;
    events::EventBus* bus_ = nullptr;
    bool estimate_total_ = true;

    ScanSummary summary_;
    std::filesystem::path root_;
    std::size_t estimated_total_ = 0;
    std::chrono::steady_clock::time_point last_progress_{};

    // Sampled once per scan so equal mtimes convert to equal seconds
    std::filesystem::file_time_type file_clock_origin_{};
    std::chrono::system_clock::time_point system_clock_origin_{};
};

} // namespace dedup::scan
