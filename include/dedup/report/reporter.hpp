#pragma once

#include "dedup/core/result.hpp"
#include "dedup/core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace dedup::report {

/**
 * @brief Headline numbers for one scan
 */
struct ScanStats {
    std::size_t total_files_scanned = 0;
    std::size_t duplicate_groups_found = 0;
    std::size_t total_duplicate_files = 0;   ///< Every copy, kept ones included
    std::size_t files_to_delete = 0;
    std::uintmax_t space_to_recover = 0;     ///< Bytes

    /// "1.50 KB", "2.00 GB": 1024 based, two decimals
    std::string space_human() const;
};

std::string format_bytes(std::uintmax_t bytes);

/**
 * @brief Renders decisions as a table, CSV or JSON
 */
class Reporter {
public:
    /// Space comes from the group sizes; decisions without a group count zero bytes
    ScanStats calculate_stats(const std::vector<Decision>& decisions,
                              const DuplicateMap& groups,
                              std::size_t total_files_scanned) const;

    std::string generate_table(const std::vector<Decision>& decisions, const ScanStats& stats) const;

    /// Header: Group,Hash,Action,File Path
    std::string generate_csv(const std::vector<Decision>& decisions) const;

    nlohmann::json to_json(const std::vector<Decision>& decisions, const ScanStats& stats) const;

    std::string generate_json(const std::vector<Decision>& decisions, const ScanStats& stats) const;

    Result<void> save_csv(const std::vector<Decision>& decisions, const std::filesystem::path& path) const;

    Result<void> save_json(const std::vector<Decision>& decisions,
                           const ScanStats& stats,
                           const std::filesystem::path& path) const;

    /// One-line-per-figure summary for the deletion confirmation prompt
    std::string summary(const ScanStats& stats) const;

    /// Write an already rendered report
    Result<void> save(const std::filesystem::path& path, const std::string& contents) const;
};

} // namespace dedup::report
