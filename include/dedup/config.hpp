#pragma once

#include "dedup/core/result.hpp"
#include "dedup/hash/hash_engine.hpp"
#include "dedup/resolve/deleter.hpp"
#include "dedup/resolve/keep_strategy.hpp"
#include "dedup/scan/scanner.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace dedup {

struct LogOptions {
    std::string level = "info";  ///< spdlog level name: trace, debug, info, warn, error, critical, off
};

/**
 * @brief Every tunable of a scan/clean run
 *
 * JSON layout (all keys optional):
 * {
 *   "scan":   {"file_types": ["text"], "exclude_dirs": [".git"],
 *              "use_default_excludes": true, "estimate_total": true},
 *   "hash":   {"chunk_threshold": 10485760, "chunk_size": 4194304, "workers": 1},
 *   "keep":   {"tie_break": "enumeration" | "lexicographic"},
 *   "delete": {"dry_run": false, "trash_dir": "/path"},
 *   "log":    {"level": "info"}
 * }
 */
struct Config {
    dedup::scan::ScanOptions scan;
    dedup::hash::HashOptions hash;
    dedup::resolve::KeepOptions keep;
    dedup::resolve::DeleteOptions removal;
    LogOptions log;
};

Result<Config> load_config(const std::filesystem::path& path);

/// Overlay the keys present in j onto defaults; InvalidArgument on bad values
Result<Config> config_from_json(const nlohmann::json& j);

nlohmann::json config_to_json(const Config& config);

} // namespace dedup
