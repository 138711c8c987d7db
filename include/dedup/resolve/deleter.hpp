#pragma once

#include "dedup/core/result.hpp"
#include "dedup/core/types.hpp"
#include "dedup/events/event_bus.hpp"
#include "dedup/resolve/trash.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dedup::resolve {

enum class DeleteMode {
    DryRun,  ///< Validate and report, never touch the filesystem
    Live     ///< Move to the trash
};

struct DeleteOptions {
    bool dry_run = false;
    std::optional<std::filesystem::path> trash_dir;  ///< Overrides the platform trash
};

/**
 * @brief Removes the non-kept members of duplicate groups, recoverably
 *
 * Each file is re-validated right before acting because the tree may have
 * changed since the scan. Failures are per file: one bad path never stops
 * the rest of a batch.
 */
class Deleter {
public:
    /**
     * @param trash Live mode target; nullptr means the platform default,
     *              resolved on first use
     */
    explicit Deleter(DeleteMode mode,
                     std::unique_ptr<TrashBin> trash = nullptr,
                     events::EventBus* bus = nullptr);

    [[nodiscard]] DeleteMode mode() const noexcept { return mode_; }
    [[nodiscard]] bool dry_run() const noexcept { return mode_ == DeleteMode::DryRun; }

    /**
     * @brief Trash one file
     *
     * NotFound when missing, PathKindMismatch when no longer a regular file,
     * PermissionDenied / GenericIOFailure when the move fails.
     */
    DeletionOutcome delete_file(const std::string& path);

    std::vector<DeletionOutcome> delete_files(const std::vector<std::string>& paths);

    /**
     * @brief Trash every to_delete path of every decision
     *
     * keep paths are never touched, even if a malformed decision also lists
     * one of them for deletion.
     */
    DeletionSummary delete_decisions(const std::vector<Decision>& decisions);

    /// Paths delete_decisions() would act on; no side effects
    static std::vector<std::string> preview(const std::vector<Decision>& decisions);

    /// nullptr until a live deletion resolved the trash
    [[nodiscard]] const TrashBin* trash() const noexcept { return trash_.get(); }

private:
    DeletionOutcome fail(const std::string& path, Error error);

    DeleteMode mode_;
    std::unique_ptr<TrashBin> trash_;
    events::EventBus* bus_ = nullptr;
};

} // namespace dedup::resolve
