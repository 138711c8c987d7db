#pragma once

#include "dedup/core/result.hpp"
#include "dedup/core/types.hpp"
#include "dedup/events/event_bus.hpp"
#include "dedup/hash/hash_cache.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace dedup::hash {

struct HashOptions {
    std::uintmax_t chunk_threshold = 10 * 1024 * 1024; ///< Files above this are read in chunks
    std::size_t chunk_size = 4 * 1024 * 1024;
    std::size_t workers = 1;                            ///< > 1 hashes on a thread pool
};

/// Receives floor(completed / total * 100) after every hashed candidate
using ProgressObserver = std::function<void(int)>;

/**
 * @brief Counters for the most recent find_duplicates()
 */
struct HashStats {
    std::size_t input_files = 0;
    std::size_t unique_sizes = 0;     ///< Files discarded by the size pre-filter, never hashed
    std::size_t candidates = 0;       ///< Files in multi-member size buckets
    std::size_t hashed = 0;
    std::size_t failures = 0;
    std::size_t groups = 0;
};

/**
 * @brief SHA-256 content fingerprints and duplicate grouping
 *
 * Grouping happens in two phases: bucket by exact size, then hash only the
 * members of buckets with two or more files. Memory use while hashing is
 * bounded by chunk_size for files above chunk_threshold.
 */
class HashEngine {
public:
    explicit HashEngine(HashCache& cache, HashOptions options = {}, events::EventBus* bus = nullptr);

    /**
     * @brief Hex SHA-256 of a file's bytes
     *
     * Errors: NotFound, PathKindMismatch (not a regular file),
     * PermissionDenied, GenericIOFailure.
     */
    Result<std::string> digest(const std::string& path);

    /**
     * @brief Group records into duplicate sets
     *
     * Only groups with at least two members are returned. A member that fails
     * to hash is logged, counted in last_stats().failures and left out.
     */
    DuplicateMap find_duplicates(const std::vector<FileRecord>& records,
                                 const ProgressObserver& observer = {});

    void clear_cache() { cache_.clear(); }

    [[nodiscard]] const HashStats& last_stats() const noexcept { return stats_; }

    [[nodiscard]] const HashOptions& options() const noexcept { return options_; }

private:
    /// Reads the file in buffer_size blocks; the digest does not depend on buffer_size
    Result<std::string> hash_file(const std::string& path, std::size_t buffer_size) const;

    /// digest() result per candidate, in candidate order, computed sequentially or on the pool
    std::vector<Result<std::string>> hash_candidates(const std::vector<const FileRecord*>& candidates,
                                                     const ProgressObserver& observer);

    HashCache& cache_;
    HashOptions options_;
    events::EventBus* bus_ = nullptr;
    HashStats stats_;
};

} // namespace dedup::hash
