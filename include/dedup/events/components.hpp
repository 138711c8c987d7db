/**
 * @file components.hpp
 * @brief Ready-made observers for pipeline events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // scan/hash/delete with &bus, then read metrics.get_stats()
 */

#pragma once

#include "dedup/events/event_bus.hpp"
#include "dedup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace dedup::events {

/**
 * @brief Writes every pipeline event to spdlog
 *
 * Progress goes to debug so a default run stays quiet; skips that carry an
 * error go to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ScanStartedEvent>([this](const ScanStartedEvent& e) {
            on_scan_started(e);
        });

        bus_.subscribe<ScanProgressEvent>([this](const ScanProgressEvent& e) {
            on_scan_progress(e);
        });

        bus_.subscribe<ScanCompletedEvent>([this](const ScanCompletedEvent& e) {
            on_scan_completed(e);
        });

        bus_.subscribe<EntrySkippedEvent>([this](const EntrySkippedEvent& e) {
            on_entry_skipped(e);
        });

        bus_.subscribe<HashProgressEvent>([this](const HashProgressEvent& e) {
            on_hash_progress(e);
        });

        bus_.subscribe<DuplicateGroupFoundEvent>([this](const DuplicateGroupFoundEvent& e) {
            on_group_found(e);
        });

        bus_.subscribe<FileTrashedEvent>([this](const FileTrashedEvent& e) {
            on_file_trashed(e);
        });

        bus_.subscribe<DeletionFailedEvent>([this](const DeletionFailedEvent& e) {
            on_deletion_failed(e);
        });
    }

private:
    void on_scan_started(const ScanStartedEvent& e) {
        spdlog::info("[ScanStarted] root={} estimated_files={}", e.root, e.estimated_total);
    }

    void on_scan_progress(const ScanProgressEvent& e) {
        spdlog::debug("[ScanProgress] {}/{} ({}%) dir={}",
                      e.processed, e.estimated_total, e.percent, e.current_dir);
    }

    void on_scan_completed(const ScanCompletedEvent& e) {
        spdlog::info("[ScanCompleted] root={} processed={} symlinks={} filtered={} excluded_dirs={} errors={} duration={}ms",
                     e.root,
                     e.summary.processed,
                     e.summary.skipped_symlinks,
                     e.summary.filtered,
                     e.summary.excluded_dirs,
                     e.summary.errors,
                     e.duration.count());
    }

    void on_entry_skipped(const EntrySkippedEvent& e) {
        if (e.error) {
            spdlog::warn("[Skipped] path={} reason={} error={}",
                         e.path, to_string(e.reason), e.error->describe());
        } else {
            spdlog::debug("[Skipped] path={} reason={}", e.path, to_string(e.reason));
        }
    }

    void on_hash_progress(const HashProgressEvent& e) {
        spdlog::debug("[HashProgress] {}/{} ({}%)", e.completed, e.total, e.percent);
    }

    void on_group_found(const DuplicateGroupFoundEvent& e) {
        spdlog::debug("[DuplicateGroup] hash={} size={} members={}",
                      e.fingerprint, e.size, e.member_count);
    }

    void on_file_trashed(const FileTrashedEvent& e) {
        if (e.dry_run) {
            spdlog::info("[DryRun] would trash {}", e.path);
        } else {
            spdlog::info("[Trashed] {} -> {}", e.path, e.trash_path);
        }
    }

    void on_deletion_failed(const DeletionFailedEvent& e) {
        spdlog::error("[DeleteFailed] path={} error={}", e.path, e.error.describe());
    }

    EventBus& bus_;
};

/**
 * @brief Counts pipeline outcomes
 *
 * Counters are atomic because hash workers emit from their own threads.
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> scans_completed{0};
        std::atomic<uint64_t> files_scanned{0};
        std::atomic<uint64_t> entries_skipped{0};
        std::atomic<uint64_t> scan_errors{0};
        std::atomic<uint64_t> hash_failures{0};
        std::atomic<uint64_t> groups_found{0};
        std::atomic<uint64_t> bytes_reclaimable{0};
        std::atomic<uint64_t> files_trashed{0};
        std::atomic<uint64_t> deletion_failures{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ScanCompletedEvent>([this](const ScanCompletedEvent& e) {
            stats_.scans_completed++;
            stats_.files_scanned += e.summary.processed;
        });

        bus_.subscribe<EntrySkippedEvent>([this](const EntrySkippedEvent& e) {
            stats_.entries_skipped++;
            if (e.reason == EntrySkippedEvent::Reason::IOError) {
                stats_.scan_errors++;
            } else if (e.reason == EntrySkippedEvent::Reason::HashFailed) {
                stats_.hash_failures++;
            }
        });

        bus_.subscribe<DuplicateGroupFoundEvent>([this](const DuplicateGroupFoundEvent& e) {
            stats_.groups_found++;
            if (e.member_count > 1) {
                stats_.bytes_reclaimable += e.size * (e.member_count - 1);
            }
        });

        bus_.subscribe<FileTrashedEvent>([this](const FileTrashedEvent&) {
            stats_.files_trashed++;
        });

        bus_.subscribe<DeletionFailedEvent>([this](const DeletionFailedEvent&) {
            stats_.deletion_failures++;
        });
    }

    const Stats& get_stats() const { return stats_; }

    void log_summary() const {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Files scanned:      {}", stats_.files_scanned.load());
        spdlog::info("Entries skipped:    {}", stats_.entries_skipped.load());
        spdlog::info("Duplicate groups:   {}", stats_.groups_found.load());
        spdlog::info("Bytes reclaimable:  {}", stats_.bytes_reclaimable.load());
        spdlog::info("Files trashed:      {}", stats_.files_trashed.load());
        spdlog::info("Deletion failures:  {}", stats_.deletion_failures.load());
        spdlog::info("════════════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace dedup::events
