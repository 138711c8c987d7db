#pragma once

#include "dedup/core/result.hpp"
#include "dedup/core/types.hpp"

#include <vector>

namespace dedup::resolve {

/**
 * @brief What decides between members tied on mtime and path length
 */
enum class TieBreak {
    EnumerationOrder,  ///< Stable sort: the member the scanner produced first wins
    Lexicographic      ///< Smallest path string wins, independent of traversal order
};

struct KeepOptions {
    TieBreak tie_break = TieBreak::EnumerationOrder;
};

/**
 * @brief Picks the one file to keep in each duplicate group
 *
 * Ranking: newest mtime first, then shortest path, then the tie-break.
 * The top-ranked member is kept; the rest are deleted in ranked order.
 */
class KeepStrategy {
public:
    explicit KeepStrategy(KeepOptions options = {});

    /**
     * @brief Resolve one group
     *
     * A single-member group is kept with nothing to delete. An empty group
     * is InvalidArgument.
     */
    Result<Decision> decide(const DuplicateGroup& group) const;

    /// decide() for every group, in fingerprint order
    std::vector<Decision> analyze(const DuplicateMap& duplicates) const;

    /// Members in ranked order (head is the keeper)
    std::vector<FileRecord> rank(std::vector<FileRecord> members) const;

    [[nodiscard]] const KeepOptions& options() const noexcept { return options_; }

private:
    KeepOptions options_;
};

const char* to_string(TieBreak tie_break) noexcept;

} // namespace dedup::resolve
