#pragma once

#if defined(_WIN32)
    #define DEDUP_PLATFORM_WINDOWS
#elif defined(__APPLE__)
    #define DEDUP_PLATFORM_MACOS
#else
    #define DEDUP_PLATFORM_LINUX
#endif

namespace dedup {

enum class Platform {
    Windows,
    MacOS,
    Linux,
    Unknown
};

inline Platform get_platform() {
#ifdef DEDUP_PLATFORM_WINDOWS
    return Platform::Windows;
#elif defined(DEDUP_PLATFORM_MACOS)
    return Platform::MacOS;
#elif defined(DEDUP_PLATFORM_LINUX)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

inline const char* platform_name() {
    switch(get_platform()) {
        case Platform::Windows: return "Windows";
        case Platform::MacOS: return "macOS";
        case Platform::Linux: return "Linux";
        default: return "Unknown";
    }
}

} // namespace dedup
