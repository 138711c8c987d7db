#include "dedup/scan/filter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace dedup::scan {
namespace fs = std::filesystem;

// ────────────────────────────────────────────────────────────
// GlobPattern
// ────────────────────────────────────────────────────────────

GlobPattern::GlobPattern(std::string pattern)
    : pattern_(std::move(pattern)),
      literal_(pattern_.find_first_of("*?[") == std::string::npos) {
    if (literal_) {
        return;
    }
    try {
        regex_ = std::regex(glob_to_regex(pattern_));
    } catch (const std::regex_error& e) {
        spdlog::error("Invalid exclude pattern '{}': {}", pattern_, e.what());
        // Fallback: exact match only
        literal_ = true;
    }
}

bool GlobPattern::matches(const std::string& name) const {
    if (literal_) {
        return name == pattern_;
    }
    return std::regex_match(name, regex_);
}

std::string GlobPattern::glob_to_regex(const std::string& pattern) {
    auto escape = [](char c) {
        std::string out;
        if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' ||
            c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
            c == '|' || c == '\\' || c == '*') {
            out += '\\';
        }
        out += c;
        return out;
    };

    std::string regex_pattern;
    size_t i = 0;
    while (i < pattern.size()) {
        const char c = pattern[i];
        // [\s\S] rather than '.', which stops at line terminators
        if (c == '*') {
            regex_pattern += "[\\s\\S]*";
            ++i;
        } else if (c == '?') {
            regex_pattern += "[\\s\\S]";
            ++i;
        } else if (c == '[') {
            // Find the closing bracket; a ']' right after '[' or '[!' is literal
            size_t j = i + 1;
            if (j < pattern.size() && pattern[j] == '!') {
                ++j;
            }
            if (j < pattern.size() && pattern[j] == ']') {
                ++j;
            }
            while (j < pattern.size() && pattern[j] != ']') {
                ++j;
            }
            if (j >= pattern.size()) {
                regex_pattern += "\\[";
                ++i;
                continue;
            }

            std::string body = pattern.substr(i + 1, j - i - 1);
            std::string cls = "[";
            size_t k = 0;
            if (!body.empty() && body[0] == '!') {
                cls += '^';
                k = 1;
            }
            for (; k < body.size(); ++k) {
                const char bc = body[k];
                if (bc == '\\' || bc == '[' || bc == ']' || bc == '^') {
                    cls += '\\';
                }
                cls += bc;
            }
            cls += ']';
            regex_pattern += cls;
            i = j + 1;
        } else {
            regex_pattern += escape(c);
            ++i;
        }
    }
    return regex_pattern;
}

// ────────────────────────────────────────────────────────────
// FileFilter
// ────────────────────────────────────────────────────────────

const std::vector<std::string>& FileFilter::default_exclude_patterns() {
    static const std::vector<std::string> patterns{
        ".git",
        ".gitignore",
        ".hg",
        ".hgignore",
        ".svn",
        "__pycache__",
        ".pytest_cache",
        ".tox",
        ".venv",
        "venv",
        "node_modules",
        ".idea",
        ".vscode",
        "dist",
        "build",
        ".mypy_cache",
        "*.egg-info",
    };
    return patterns;
}

FileFilter::FileFilter()
    : FileFilter(std::vector<FileType>{}) {}

FileFilter::FileFilter(std::vector<FileType> file_types,
                       std::optional<std::vector<std::string>> exclude_dirs,
                       bool use_default_excludes) {
    set_file_types(file_types);

    if (exclude_dirs) {
        for (const auto& pattern : *exclude_dirs) {
            exclude_patterns_.emplace_back(pattern);
        }
    } else if (use_default_excludes) {
        for (const auto& pattern : default_exclude_patterns()) {
            exclude_patterns_.emplace_back(pattern);
        }
    }

    explicit_filters_ = !file_types.empty() || exclude_dirs.has_value();
}

bool FileFilter::should_include_file(const fs::path& path) const {
    if (!extension_allowed(path)) {
        return false;
    }

    for (const auto& part : path.parent_path()) {
        const std::string name = part.string();
        if (name.empty() || part == path.root_directory() || part == path.root_name()) {
            continue;
        }
        if (is_excluded_directory(name)) {
            return false;
        }
    }
    return true;
}

bool FileFilter::is_excluded_directory(const std::string& name) const {
    return std::any_of(exclude_patterns_.begin(), exclude_patterns_.end(),
                       [&name](const GlobPattern& pattern) { return pattern.matches(name); });
}

std::vector<std::string> FileFilter::filter_files(const std::vector<std::string>& paths) const {
    std::vector<std::string> kept;
    for (const auto& path : paths) {
        if (should_include_file(path)) {
            kept.push_back(path);
        }
    }
    return kept;
}

void FileFilter::add_exclude_pattern(const std::string& pattern) {
    const bool present = std::any_of(exclude_patterns_.begin(), exclude_patterns_.end(),
                                     [&pattern](const GlobPattern& p) { return p.text() == pattern; });
    if (!present) {
        exclude_patterns_.emplace_back(pattern);
    }
}

void FileFilter::set_file_types(const std::vector<FileType>& file_types) {
    allowed_extensions_.clear();
    for (FileType type : file_types) {
        for (auto& ext : supported_extensions(type)) {
            allowed_extensions_.insert(std::move(ext));
        }
    }
    if (!file_types.empty()) {
        explicit_filters_ = true;
    }
}

std::vector<std::string> FileFilter::exclude_patterns() const {
    std::vector<std::string> patterns;
    patterns.reserve(exclude_patterns_.size());
    for (const auto& pattern : exclude_patterns_) {
        patterns.push_back(pattern.text());
    }
    return patterns;
}

bool FileFilter::extension_allowed(const fs::path& path) const {
    if (allowed_extensions_.empty()) {
        return true;
    }
    const std::string ext = path.extension().string();
    if (ext.empty()) {
        return false;
    }
    return allowed_extensions_.count("." + normalize_extension(ext)) > 0;
}

} // namespace dedup::scan
