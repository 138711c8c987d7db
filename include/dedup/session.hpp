#pragma once

#include "dedup/config.hpp"
#include "dedup/core/result.hpp"
#include "dedup/core/types.hpp"
#include "dedup/events/event_bus.hpp"
#include "dedup/hash/hash_cache.hpp"
#include "dedup/hash/hash_engine.hpp"

#include <filesystem>
#include <vector>

namespace dedup {

/**
 * @brief Everything one scan produced
 */
struct FindResult {
    ScanSummary scan;
    hash::HashStats hashing;
    DuplicateMap groups;
    std::vector<Decision> decisions;
};

/**
 * @brief One scanning session: scan -> size buckets -> hash -> keep decisions
 *
 * Owns the hash cache for its lifetime, so fingerprints never leak into a
 * later session. Deletion is a separate step so a caller can preview and
 * confirm in between.
 */
class DedupSession {
public:
    explicit DedupSession(Config config, events::EventBus* bus = nullptr);

    DedupSession(const DedupSession&) = delete;
    DedupSession& operator=(const DedupSession&) = delete;

    /// Fails only when the root cannot be scanned
    Result<FindResult> find(const std::filesystem::path& root,
                            const hash::ProgressObserver& observer = {});

    /// Trash (or simulate, per config) every to_delete path
    DeletionSummary remove(const std::vector<Decision>& decisions);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    [[nodiscard]] const hash::HashCache& cache() const noexcept { return cache_; }

private:
    Config config_;
    events::EventBus* bus_ = nullptr;
    hash::HashCache cache_;
};

} // namespace dedup
