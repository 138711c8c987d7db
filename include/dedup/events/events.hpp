/**
 * @file events.hpp
 * @brief Event types emitted while scanning, hashing and deleting
 *
 * WHY THIS FILE EXISTS:
 * The pipeline stages report progress and per-file outcomes without knowing
 * who is listening. The CLI renders a progress bar from them, the logger
 * component writes them to spdlog, the metrics component counts them.
 *
 * NAMING CONVENTION:
 * - Events are past-tense or progress nouns: ScanCompletedEvent, HashProgressEvent
 * - Progress events never influence results; dropping them is always safe
 */

#pragma once

#include "dedup/core/error.hpp"
#include "dedup/core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace dedup::events {

// ════════════════════════════════════════════════════════
// Scan Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once before the first entry is visited
 *
 * WHO EMITS: DirectoryScanner::scan
 * WHO SUBSCRIBES: Logger, progress bar (to size itself)
 *
 * estimated_total is zero when the pre-walk is disabled.
 */
struct ScanStartedEvent {
    std::string root;
    std::size_t estimated_total;
    std::chrono::system_clock::time_point timestamp;

    ScanStartedEvent(std::string r, std::size_t total)
        : root(std::move(r)),
          estimated_total(total),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Throttled walk progress
 *
 * WHO EMITS: DirectoryScanner::scan, at most every 100 processed files or
 * once a second has passed since the previous update
 * WHO SUBSCRIBES: progress bar
 */
struct ScanProgressEvent {
    std::size_t processed = 0;
    std::size_t estimated_total = 0;
    int percent = 0;           ///< Capped at 100; the estimate may undercount
    std::string current_dir;   ///< Relative to the scan root
};

/**
 * @brief Emitted when the walk ends (normally or stopped by the sink)
 *
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct ScanCompletedEvent {
    std::string root;
    ScanSummary summary;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief An entry was passed over
 *
 * WHO EMITS: DirectoryScanner (symlinks, I/O errors), HashEngine (hash failures)
 * WHO SUBSCRIBES: Logger (debug level), Metrics
 */
struct EntrySkippedEvent {
    enum class Reason {
        Symlink,
        Filtered,
        ExcludedDirectory,
        SpecialFile,
        IOError,
        HashFailed
    };

    std::string path;
    Reason reason = Reason::IOError;
    std::optional<Error> error;
};

const char* to_string(EntrySkippedEvent::Reason reason) noexcept;

// ════════════════════════════════════════════════════════
// Hash Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after each size-bucket candidate is hashed (or fails)
 *
 * percent = floor(completed / total * 100) where total counts only files in
 * multi-member size buckets. Non-decreasing within one find_duplicates call.
 */
struct HashProgressEvent {
    std::size_t completed = 0;
    std::size_t total = 0;
    int percent = 0;
};

/**
 * @brief A fingerprint turned out to be shared by two or more files
 */
struct DuplicateGroupFoundEvent {
    std::string fingerprint;
    std::uintmax_t size = 0;
    std::size_t member_count = 0;
};

// ════════════════════════════════════════════════════════
// Deletion Events
// ════════════════════════════════════════════════════════

/**
 * @brief A duplicate was moved to the trash (or would have been, in dry-run)
 *
 * WHO EMITS: Deleter::delete_file
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct FileTrashedEvent {
    std::string path;
    std::string trash_path;    ///< Empty in dry-run
    bool dry_run = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct DeletionFailedEvent {
    std::string path;
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace dedup::events
