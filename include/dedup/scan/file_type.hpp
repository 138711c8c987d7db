#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dedup::scan {

/**
 * @brief Coarse category of a file, derived from its extension
 */
enum class FileType {
    Text,
    Audio,
    Video,
    Archive,
    Unknown
};

/**
 * @brief Look up the category of an extension
 *
 * Accepts "pdf", ".pdf" or ".PDF"; unmapped extensions give FileType::Unknown.
 */
FileType get_type(std::string_view extension);

bool is_supported(std::string_view extension);

/**
 * @brief All extensions of a category, sorted, with leading dots
 *
 * Empty for FileType::Unknown.
 */
std::vector<std::string> supported_extensions(FileType type);

const char* to_string(FileType type) noexcept;

/// Case-insensitive; "unknown" and unmapped names give nullopt
std::optional<FileType> parse_file_type(std::string_view name);

/// Lower-case and strip one leading dot
std::string normalize_extension(std::string_view extension);

} // namespace dedup::scan
