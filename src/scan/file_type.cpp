#include "dedup/scan/file_type.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace dedup::scan {
namespace {

const std::unordered_map<std::string, FileType>& extension_map() {
    static const std::unordered_map<std::string, FileType> map{
        {"txt", FileType::Text},
        {"md", FileType::Text},
        {"rtf", FileType::Text},
        {"doc", FileType::Text},
        {"docx", FileType::Text},
        {"pdf", FileType::Text},

        {"mp3", FileType::Audio},
        {"m4a", FileType::Audio},
        {"wav", FileType::Audio},
        {"aac", FileType::Audio},
        {"flac", FileType::Audio},

        {"mp4", FileType::Video},
        {"mov", FileType::Video},
        {"avi", FileType::Video},
        {"mkv", FileType::Video},
        {"webm", FileType::Video},

        {"zip", FileType::Archive},
        {"rar", FileType::Archive},
        {"7z", FileType::Archive},
        {"tar", FileType::Archive},
        {"gz", FileType::Archive},
        {"bz2", FileType::Archive},
        {"dmg", FileType::Archive},
        {"pkg", FileType::Archive},
    };
    return map;
}

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace

std::string normalize_extension(std::string_view extension) {
    if (!extension.empty() && extension.front() == '.') {
        extension.remove_prefix(1);
    }
    return to_lower(extension);
}

FileType get_type(std::string_view extension) {
    const auto& map = extension_map();
    auto it = map.find(normalize_extension(extension));
    return it != map.end() ? it->second : FileType::Unknown;
}

bool is_supported(std::string_view extension) {
    return get_type(extension) != FileType::Unknown;
}

std::vector<std::string> supported_extensions(FileType type) {
    std::vector<std::string> extensions;
    if (type == FileType::Unknown) {
        return extensions;
    }
    for (const auto& [ext, mapped] : extension_map()) {
        if (mapped == type) {
            extensions.push_back("." + ext);
        }
    }
    std::sort(extensions.begin(), extensions.end());
    return extensions;
}

const char* to_string(FileType type) noexcept {
    switch (type) {
        case FileType::Text: return "text";
        case FileType::Audio: return "audio";
        case FileType::Video: return "video";
        case FileType::Archive: return "archive";
        case FileType::Unknown: return "unknown";
    }
    return "unknown";
}

std::optional<FileType> parse_file_type(std::string_view name) {
    const std::string lowered = to_lower(name);
    for (FileType type : {FileType::Text, FileType::Audio, FileType::Video, FileType::Archive}) {
        if (lowered == to_string(type)) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace dedup::scan
