#include "dedup/session.hpp"

#include "dedup/resolve/deleter.hpp"
#include "dedup/resolve/keep_strategy.hpp"
#include "dedup/scan/scanner.hpp"

#include <spdlog/spdlog.h>

namespace dedup {
namespace fs = std::filesystem;

DedupSession::DedupSession(Config config, events::EventBus* bus)
    : config_(std::move(config)), bus_(bus) {}

Result<FindResult> DedupSession::find(const fs::path& root, const hash::ProgressObserver& observer) {
    scan::DirectoryScanner scanner(config_.scan, bus_);

    auto records = scanner.collect(root);
    if (records.is_error()) {
        return Err<FindResult>(records.error());
    }

    FindResult result;
    result.scan = scanner.last_summary();

    hash::HashEngine engine(cache_, config_.hash, bus_);
    result.groups = engine.find_duplicates(records.value(), observer);
    result.hashing = engine.last_stats();

    resolve::KeepStrategy strategy(config_.keep);
    result.decisions = strategy.analyze(result.groups);

    spdlog::info("{} files scanned, {} hashed, {} duplicate groups",
                 result.scan.processed, result.hashing.hashed, result.decisions.size());
    return Ok(std::move(result));
}

DeletionSummary DedupSession::remove(const std::vector<Decision>& decisions) {
    const auto mode = config_.removal.dry_run ? resolve::DeleteMode::DryRun : resolve::DeleteMode::Live;

    std::unique_ptr<resolve::TrashBin> trash;
    if (config_.removal.trash_dir) {
        auto made = resolve::make_default_trash(config_.removal.trash_dir);
        if (made.is_error()) {
            spdlog::warn("Ignoring trash_dir: {}", made.error().describe());
        } else {
            trash = std::move(made.value());
        }
    }

    resolve::Deleter deleter(mode, std::move(trash), bus_);
    return deleter.delete_decisions(decisions);
}

} // namespace dedup
