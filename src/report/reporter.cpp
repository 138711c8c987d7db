#include "dedup/report/reporter.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace dedup::report {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string rule(char c, std::size_t width) {
    return std::string(width, c);
}

} // namespace

std::string format_bytes(std::uintmax_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    for (const char* unit : units) {
        if (size < 1024.0) {
            oss << size << ' ' << unit;
            return oss.str();
        }
        size /= 1024.0;
    }
    oss << size << " PB";
    return oss.str();
}

std::string ScanStats::space_human() const {
    return format_bytes(space_to_recover);
}

ScanStats Reporter::calculate_stats(const std::vector<Decision>& decisions,
                                    const DuplicateMap& groups,
                                    std::size_t total_files_scanned) const {
    ScanStats stats;
    stats.total_files_scanned = total_files_scanned;
    stats.duplicate_groups_found = decisions.size();

    for (const auto& decision : decisions) {
        stats.total_duplicate_files += decision.to_delete.size() + 1;
        stats.files_to_delete += decision.to_delete.size();

        auto it = groups.find(decision.fingerprint);
        if (it != groups.end()) {
            stats.space_to_recover += it->second.size * decision.to_delete.size();
        }
    }
    return stats;
}

std::string Reporter::generate_table(const std::vector<Decision>& decisions, const ScanStats& stats) const {
    std::ostringstream out;

    out << rule('=', 80) << '\n';
    out << "Total Files Scanned: " << stats.total_files_scanned << '\n';
    out << "Duplicate Groups Found: " << stats.duplicate_groups_found << '\n';
    out << "Total Duplicate Files: " << stats.total_duplicate_files << '\n';
    out << "Files to Delete: " << stats.files_to_delete << '\n';
    out << "Space to Recover: " << stats.space_human() << '\n';
    out << rule('=', 80) << "\n\n";

    if (decisions.empty()) {
        out << "No duplicates found.\n";
        return out.str();
    }

    std::size_t index = 1;
    for (const auto& decision : decisions) {
        out << '[' << index++ << "] Hash: " << decision.fingerprint.substr(0, 16) << "...\n";
        out << "    KEEP: " << decision.keep << '\n';
        for (const auto& path : decision.to_delete) {
            out << "    DELETE: " << path << '\n';
        }
        out << '\n';
    }
    return out.str();
}

std::string Reporter::generate_csv(const std::vector<Decision>& decisions) const {
    std::ostringstream out;
    out << "Group,Hash,Action,File Path\r\n";

    std::size_t index = 1;
    for (const auto& decision : decisions) {
        out << index << ',' << decision.fingerprint << ",KEEP," << csv_field(decision.keep) << "\r\n";
        for (const auto& path : decision.to_delete) {
            out << index << ',' << decision.fingerprint << ",DELETE," << csv_field(path) << "\r\n";
        }
        ++index;
    }
    return out.str();
}

json Reporter::to_json(const std::vector<Decision>& decisions, const ScanStats& stats) const {
    json groups = json::array();
    for (const auto& decision : decisions) {
        groups.push_back({
            {"hash", decision.fingerprint},
            {"keep_file", decision.keep},
            {"delete_files", decision.to_delete}
        });
    }

    return json{
        {"summary", {
            {"total_files_scanned", stats.total_files_scanned},
            {"duplicate_groups_found", stats.duplicate_groups_found},
            {"total_duplicate_files", stats.total_duplicate_files},
            {"files_to_delete", stats.files_to_delete},
            {"space_to_recover_bytes", stats.space_to_recover},
            {"space_to_recover_human", stats.space_human()}
        }},
        {"groups", groups}
    };
}

std::string Reporter::generate_json(const std::vector<Decision>& decisions, const ScanStats& stats) const {
    return to_json(decisions, stats).dump(2);
}

Result<void> Reporter::save_csv(const std::vector<Decision>& decisions, const fs::path& path) const {
    return save(path, generate_csv(decisions));
}

Result<void> Reporter::save_json(const std::vector<Decision>& decisions,
                                 const ScanStats& stats,
                                 const fs::path& path) const {
    return save(path, generate_json(decisions, stats));
}

std::string Reporter::summary(const ScanStats& stats) const {
    std::ostringstream out;
    out << rule('=', 50) << '\n';
    out << "Scan Summary\n";
    out << rule('=', 50) << '\n';
    out << "Files Scanned:     " << stats.total_files_scanned << '\n';
    out << "Duplicate Groups:  " << stats.duplicate_groups_found << '\n';
    out << "Duplicate Files:   " << stats.total_duplicate_files << '\n';
    out << "Files to Delete:   " << stats.files_to_delete << '\n';
    out << "Space to Recover:  " << stats.space_human() << '\n';
    out << rule('=', 50) << '\n';
    return out.str();
}

Result<void> Reporter::save(const fs::path& path, const std::string& contents) const {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(make_error(ErrorKind::GenericIOFailure, "Failed to open report file: " + path.string(),
                                    path.string()));
    }
    output << contents;
    output.flush();
    if (!output) {
        return Err<void>(make_error(ErrorKind::GenericIOFailure, "Failed to write report file: " + path.string(),
                                    path.string()));
    }
    return Ok();
}

} // namespace dedup::report
