#include "dedup/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace dedup {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<void> read_scan(const json& j, scan::ScanOptions& options) {
    if (j.contains("file_types")) {
        options.file_types.clear();
        for (const auto& name : j.at("file_types")) {
            const auto type = scan::parse_file_type(name.get<std::string>());
            if (!type) {
                return Err<void>(make_error(ErrorKind::InvalidArgument,
                                            "Unknown file type: " + name.get<std::string>()));
            }
            options.file_types.push_back(*type);
        }
    }
    if (j.contains("exclude_dirs")) {
        options.exclude_dirs = j.at("exclude_dirs").get<std::vector<std::string>>();
    }
    options.use_default_excludes = j.value("use_default_excludes", options.use_default_excludes);
    options.estimate_total = j.value("estimate_total", options.estimate_total);
    return Ok();
}

Result<void> read_hash(const json& j, hash::HashOptions& options) {
    options.chunk_threshold = j.value("chunk_threshold", options.chunk_threshold);
    options.chunk_size = j.value("chunk_size", options.chunk_size);
    options.workers = j.value("workers", options.workers);
    if (options.chunk_size == 0) {
        return Err<void>(make_error(ErrorKind::InvalidArgument, "hash.chunk_size must be > 0"));
    }
    if (options.workers == 0) {
        return Err<void>(make_error(ErrorKind::InvalidArgument, "hash.workers must be > 0"));
    }
    return Ok();
}

Result<void> read_keep(const json& j, resolve::KeepOptions& options) {
    const std::string tie_break = j.value("tie_break", std::string(resolve::to_string(options.tie_break)));
    if (tie_break == "enumeration") {
        options.tie_break = resolve::TieBreak::EnumerationOrder;
    } else if (tie_break == "lexicographic") {
        options.tie_break = resolve::TieBreak::Lexicographic;
    } else {
        return Err<void>(make_error(ErrorKind::InvalidArgument, "Unknown keep.tie_break: " + tie_break));
    }
    return Ok();
}

} // namespace

Result<Config> config_from_json(const json& j) {
    Config config;
    if (!j.is_object()) {
        return Err<Config>(make_error(ErrorKind::InvalidArgument, "Configuration must be a JSON object"));
    }

    try {
        if (j.contains("scan")) {
            if (auto res = read_scan(j.at("scan"), config.scan); res.is_error()) {
                return Err<Config>(res.error());
            }
        }
        if (j.contains("hash")) {
            if (auto res = read_hash(j.at("hash"), config.hash); res.is_error()) {
                return Err<Config>(res.error());
            }
        }
        if (j.contains("keep")) {
            if (auto res = read_keep(j.at("keep"), config.keep); res.is_error()) {
                return Err<Config>(res.error());
            }
        }
        if (j.contains("delete")) {
            const auto& section = j.at("delete");
            config.removal.dry_run = section.value("dry_run", config.removal.dry_run);
            if (section.contains("trash_dir")) {
                config.removal.trash_dir = fs::path(section.at("trash_dir").get<std::string>());
            }
        }
        if (j.contains("log")) {
            config.log.level = j.at("log").value("level", config.log.level);
        }
    } catch (const json::exception& e) {
        return Err<Config>(make_error(ErrorKind::InvalidArgument, std::string("Invalid configuration: ") + e.what()));
    }

    return Ok(std::move(config));
}

Result<Config> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Err<Config>(make_error(ErrorKind::NotFound, "Config file not found: " + path.string(), path.string()));
        }
        return Err<Config>(make_error(ErrorKind::GenericIOFailure, "Cannot open config file: " + path.string(),
                                      path.string()));
    }

    json j;
    try {
        input >> j;
    } catch (const json::parse_error& e) {
        return Err<Config>(make_error(ErrorKind::InvalidArgument,
                                      "Malformed config " + path.string() + ": " + e.what(),
                                      path.string()));
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return config_from_json(j);
}

json config_to_json(const Config& config) {
    json file_types = json::array();
    for (auto type : config.scan.file_types) {
        file_types.push_back(scan::to_string(type));
    }

    json scan_section{
        {"file_types", file_types},
        {"use_default_excludes", config.scan.use_default_excludes},
        {"estimate_total", config.scan.estimate_total}
    };
    if (config.scan.exclude_dirs) {
        scan_section["exclude_dirs"] = *config.scan.exclude_dirs;
    }

    json delete_section{{"dry_run", config.removal.dry_run}};
    if (config.removal.trash_dir) {
        delete_section["trash_dir"] = config.removal.trash_dir->string();
    }

    return json{
        {"scan", scan_section},
        {"hash", {
            {"chunk_threshold", config.hash.chunk_threshold},
            {"chunk_size", config.hash.chunk_size},
            {"workers", config.hash.workers}
        }},
        {"keep", {{"tie_break", resolve::to_string(config.keep.tie_break)}}},
        {"delete", delete_section},
        {"log", {{"level", config.log.level}}}
    };
}

} // namespace dedup
