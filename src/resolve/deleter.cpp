#include "dedup/resolve/deleter.hpp"

#include "dedup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <unordered_set>

namespace dedup::resolve {
namespace fs = std::filesystem;

Deleter::Deleter(DeleteMode mode, std::unique_ptr<TrashBin> trash, events::EventBus* bus)
    : mode_(mode), trash_(std::move(trash)), bus_(bus) {}

DeletionOutcome Deleter::delete_file(const std::string& path) {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return fail(path, make_error(ErrorKind::NotFound, "File not found: " + path, path));
    }
    if (ec) {
        return fail(path, error_from_code(ec, path, "Cannot stat"));
    }
    if (!fs::is_regular_file(status)) {
        return fail(path, make_error(ErrorKind::PathKindMismatch, "Path is not a file: " + path, path));
    }

    if (dry_run()) {
        if (bus_ != nullptr) {
            bus_->emit(events::FileTrashedEvent{path, std::string(), true});
        }
        return DeletionOutcome{path, true, std::nullopt};
    }

    if (!trash_) {
        auto trash = make_default_trash();
        if (trash.is_error()) {
            return fail(path, trash.error());
        }
        trash_ = std::move(trash.value());
        spdlog::debug("Using trash at {}", trash_->location().string());
    }

    auto moved = trash_->move_to_trash(path);
    if (moved.is_error()) {
        return fail(path, moved.error());
    }

    if (bus_ != nullptr) {
        bus_->emit(events::FileTrashedEvent{path, moved.value().string(), false});
    }
    return DeletionOutcome{path, true, std::nullopt};
}

std::vector<DeletionOutcome> Deleter::delete_files(const std::vector<std::string>& paths) {
    std::vector<DeletionOutcome> outcomes;
    outcomes.reserve(paths.size());
    for (const auto& path : paths) {
        outcomes.push_back(delete_file(path));
    }
    return outcomes;
}

DeletionSummary Deleter::delete_decisions(const std::vector<Decision>& decisions) {
    std::unordered_set<std::string> kept;
    for (const auto& decision : decisions) {
        kept.insert(decision.keep);
    }

    DeletionSummary summary;
    for (const auto& path : preview(decisions)) {
        DeletionOutcome outcome = kept.count(path) > 0
            ? fail(path, make_error(ErrorKind::InvalidArgument, "Refusing to delete a kept file: " + path, path))
            : delete_file(path);

        if (outcome.success) {
            ++summary.success_count;
        } else {
            ++summary.failure_count;
        }
        summary.results.push_back(std::move(outcome));
    }

    spdlog::info("{}: {} succeeded, {} failed",
                 dry_run() ? "Dry run" : "Deletion",
                 summary.success_count, summary.failure_count);
    return summary;
}

std::vector<std::string> Deleter::preview(const std::vector<Decision>& decisions) {
    std::vector<std::string> paths;
    for (const auto& decision : decisions) {
        paths.insert(paths.end(), decision.to_delete.begin(), decision.to_delete.end());
    }
    return paths;
}

DeletionOutcome Deleter::fail(const std::string& path, Error error) {
    if (bus_ != nullptr) {
        bus_->emit(events::DeletionFailedEvent{path, error});
    } else {
        spdlog::warn("Cannot delete {}: {}", path, error.describe());
    }
    return DeletionOutcome{path, false, std::move(error)};
}

} // namespace dedup::resolve
