#pragma once

/**
 * @file types.hpp
 * @brief Data passed between the pipeline stages
 *
 * Scanner -> FileRecord
 * HashEngine -> DuplicateGroup (keyed by fingerprint in a DuplicateMap)
 * KeepStrategy -> Decision
 * Deleter -> DeletionOutcome / DeletionSummary
 *
 * Records and groups belong to the scan that produced them. Decisions and
 * outcomes belong to whoever asked for the deletion.
 */

#include "dedup/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dedup {

/**
 * @brief One regular file seen by the scanner
 *
 * Treated as immutable once emitted; consumers take it by const reference.
 */
struct FileRecord {
    std::string path;          ///< Absolute path
    std::uintmax_t size = 0;   ///< Bytes
    double mtime = 0.0;        ///< Last modification, seconds since the Unix epoch
    bool is_symlink = false;   ///< Always false for records emitted by the scanner
};

/**
 * @brief Counters reported at the end of a walk
 *
 * Every entry the scanner does not emit lands in exactly one counter.
 */
struct ScanSummary {
    std::size_t processed = 0;         ///< Records emitted
    std::size_t skipped_symlinks = 0;
    std::size_t filtered = 0;          ///< Regular files rejected by the filter
    std::size_t excluded_dirs = 0;     ///< Directories pruned by an exclusion pattern
    std::size_t skipped_special = 0;   ///< FIFOs, sockets, devices
    std::size_t errors = 0;            ///< Per-entry I/O failures
    bool stopped_early = false;        ///< Sink asked to stop before the walk finished
};

/**
 * @brief Files sharing both size and content fingerprint
 *
 * Members keep the order in which the scanner produced them.
 */
struct DuplicateGroup {
    std::string fingerprint;   ///< Lower-case hex SHA-256
    std::uintmax_t size = 0;
    std::vector<FileRecord> members;
};

/// Fingerprint -> group, iterated in fingerprint order
using DuplicateMap = std::map<std::string, DuplicateGroup>;

/**
 * @brief Keep/delete resolution for one duplicate group
 *
 * keep and to_delete partition the group's member paths.
 */
struct Decision {
    std::string fingerprint;
    std::string keep;
    std::vector<std::string> to_delete;
};

struct DeletionOutcome {
    std::string path;
    bool success = false;
    std::optional<Error> error;
};

struct DeletionSummary {
    std::size_t success_count = 0;
    std::size_t failure_count = 0;
    std::vector<DeletionOutcome> results;
};

} // namespace dedup
