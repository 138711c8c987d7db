#include "dedup/resolve/keep_strategy.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace dedup::resolve {
namespace {

/// Length in UTF-8 code points; continuation bytes do not count
std::size_t path_length(const std::string& path) {
    return static_cast<std::size_t>(std::count_if(path.begin(), path.end(),
        [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

} // namespace

KeepStrategy::KeepStrategy(KeepOptions options)
    : options_(options) {}

std::vector<FileRecord> KeepStrategy::rank(std::vector<FileRecord> members) const {
    const bool lexicographic = options_.tie_break == TieBreak::Lexicographic;
    std::stable_sort(members.begin(), members.end(),
        [lexicographic](const FileRecord& a, const FileRecord& b) {
            if (a.mtime != b.mtime) {
                return a.mtime > b.mtime;
            }
            const std::size_t a_length = path_length(a.path);
            const std::size_t b_length = path_length(b.path);
            if (a_length != b_length) {
                return a_length < b_length;
            }
            return lexicographic && a.path < b.path;
        });
    return members;
}

Result<Decision> KeepStrategy::decide(const DuplicateGroup& group) const {
    if (group.members.empty()) {
        return Err<Decision>(make_error(ErrorKind::InvalidArgument,
                                        "Duplicate group " + group.fingerprint + " has no members"));
    }

    const auto ranked = rank(group.members);

    Decision decision;
    decision.fingerprint = group.fingerprint;
    decision.keep = ranked.front().path;
    decision.to_delete.reserve(ranked.size() - 1);
    for (auto it = std::next(ranked.begin()); it != ranked.end(); ++it) {
        decision.to_delete.push_back(it->path);
    }
    return Ok(std::move(decision));
}

std::vector<Decision> KeepStrategy::analyze(const DuplicateMap& duplicates) const {
    std::vector<Decision> decisions;
    decisions.reserve(duplicates.size());
    for (const auto& [fingerprint, group] : duplicates) {
        auto result = decide(group);
        if (result.is_error()) {
            spdlog::warn("Skipping group {}: {}", fingerprint, result.error().describe());
            continue;
        }
        decisions.push_back(std::move(result.value()));
    }
    return decisions;
}

const char* to_string(TieBreak tie_break) noexcept {
    switch (tie_break) {
        case TieBreak::EnumerationOrder: return "enumeration";
        case TieBreak::Lexicographic: return "lexicographic";
    }
    return "enumeration";
}

} // namespace dedup::resolve
