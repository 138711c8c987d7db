#include "dedup/resolve/trash.hpp"

#include "dedup/core/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <fcntl.h>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace dedup::resolve {
namespace fs = std::filesystem;

namespace {

constexpr int kMaxNameAttempts = 10000;

Result<void> ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec && !fs::is_directory(dir)) {
        return Err<void>(error_from_code(ec, dir.string(), "Failed to create trash directory"));
    }
    return Ok();
}

std::string deletion_date() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

/// Reserve <info_dir>/<name>.trashinfo; false if it already exists
Result<bool> reserve_info_file(const fs::path& info_path, const std::string& contents) {
    const int fd = ::open(info_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
    if (fd < 0) {
        if (errno == EEXIST) {
            return Ok(false);
        }
        return Err<bool>(error_from_code(std::error_code(errno, std::generic_category()),
                                         info_path.string(), "Failed to create trash info"));
    }

    const char* data = contents.data();
    std::size_t remaining = contents.size();
    while (remaining > 0) {
        const ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            ::close(fd);
            std::error_code cleanup_ec;
            fs::remove(info_path, cleanup_ec);
            return Err<bool>(error_from_code(std::error_code(err, std::generic_category()),
                                             info_path.string(), "Failed to write trash info"));
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
    ::close(fd);
    return Ok(true);
}

std::string numbered_name(const fs::path& original, int n, const char* separator) {
    if (n == 1) {
        return original.filename().string();
    }
    return original.stem().string() + separator + std::to_string(n) + original.extension().string();
}

} // namespace

// ────────────────────────────────────────────────────────────
// move_file
// ────────────────────────────────────────────────────────────

Result<void> move_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
        return Ok();
    }
    if (ec != std::errc::cross_device_link) {
        return Err<void>(error_from_code(ec, from.string(), "Failed to move to trash"));
    }

    spdlog::debug("{} is on another filesystem, copying into the trash", from.string());
    fs::copy_file(from, to, fs::copy_options::none, ec);
    if (ec) {
        return Err<void>(error_from_code(ec, from.string(), "Failed to copy to trash"));
    }
    fs::remove(from, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(to, cleanup_ec);
        return Err<void>(error_from_code(ec, from.string(), "Failed to remove original after copy"));
    }
    return Ok();
}

// ────────────────────────────────────────────────────────────
// XdgTrashBin
// ────────────────────────────────────────────────────────────

XdgTrashBin::XdgTrashBin(fs::path root)
    : root_(std::move(root)) {}

Result<fs::path> XdgTrashBin::move_to_trash(const fs::path& file) {
    if (auto res = ensure_directory(files_dir()); res.is_error()) {
        return Err<fs::path>(res.error());
    }
    if (auto res = ensure_directory(info_dir()); res.is_error()) {
        return Err<fs::path>(res.error());
    }

    std::error_code ec;
    const fs::path absolute = fs::absolute(file, ec);
    if (ec) {
        return Err<fs::path>(error_from_code(ec, file.string(), "Cannot resolve path"));
    }

    const std::string info = "[Trash Info]\nPath=" + encode_path(absolute.string()) +
                             "\nDeletionDate=" + deletion_date() + "\n";

    for (int n = 1; n <= kMaxNameAttempts; ++n) {
        const std::string name = numbered_name(absolute, n, ".");
        const fs::path target = files_dir() / name;
        const fs::path info_path = info_dir() / (name + ".trashinfo");

        if (fs::exists(fs::symlink_status(target, ec))) {
            continue;
        }

        auto reserved = reserve_info_file(info_path, info);
        if (reserved.is_error()) {
            return Err<fs::path>(reserved.error());
        }
        if (!reserved.value()) {
            continue;
        }

        if (auto moved = move_file(absolute, target); moved.is_error()) {
            fs::remove(info_path, ec);
            return Err<fs::path>(moved.error());
        }
        return Ok(target);
    }

    return Err<fs::path>(make_error(ErrorKind::GenericIOFailure,
                                    "No free name in trash for " + absolute.string(),
                                    absolute.string()));
}

std::string XdgTrashBin::encode_path(const std::string& path) {
    std::ostringstream oss;
    for (unsigned char c : path) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                                c == '.' || c == '~' || c == '/';
        if (unreserved) {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

// ────────────────────────────────────────────────────────────
// MacTrashBin
// ────────────────────────────────────────────────────────────

MacTrashBin::MacTrashBin(fs::path dir)
    : dir_(std::move(dir)) {}

Result<fs::path> MacTrashBin::move_to_trash(const fs::path& file) {
    if (auto res = ensure_directory(dir_); res.is_error()) {
        return Err<fs::path>(res.error());
    }

    std::error_code ec;
    for (int n = 1; n <= kMaxNameAttempts; ++n) {
        const fs::path target = dir_ / numbered_name(file, n, " ");
        if (fs::exists(fs::symlink_status(target, ec))) {
            continue;
        }
        if (auto moved = move_file(file, target); moved.is_error()) {
            return Err<fs::path>(moved.error());
        }
        return Ok(target);
    }

    return Err<fs::path>(make_error(ErrorKind::GenericIOFailure,
                                    "No free name in trash for " + file.string(),
                                    file.string()));
}

// ────────────────────────────────────────────────────────────
// Factory
// ────────────────────────────────────────────────────────────

Result<std::unique_ptr<TrashBin>> make_default_trash(const std::optional<fs::path>& override_dir) {
    using TrashPtr = std::unique_ptr<TrashBin>;

    if (get_platform() == Platform::MacOS) {
        if (override_dir) {
            return Ok(TrashPtr(new MacTrashBin(*override_dir)));
        }
        const char* home = std::getenv("HOME");
        if (home == nullptr || *home == '\0') {
            return Err<TrashPtr>(make_error(ErrorKind::InvalidArgument, "HOME is not set; cannot locate ~/.Trash"));
        }
        return Ok(TrashPtr(new MacTrashBin(fs::path(home) / ".Trash")));
    }

    if (override_dir) {
        return Ok(TrashPtr(new XdgTrashBin(*override_dir)));
    }
    const char* data_home = std::getenv("XDG_DATA_HOME");
    if (data_home != nullptr && *data_home != '\0') {
        return Ok(TrashPtr(new XdgTrashBin(fs::path(data_home) / "Trash")));
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return Err<TrashPtr>(make_error(ErrorKind::InvalidArgument,
                                        "Neither XDG_DATA_HOME nor HOME is set; cannot locate the trash"));
    }
    return Ok(TrashPtr(new XdgTrashBin(fs::path(home) / ".local" / "share" / "Trash")));
}

} // namespace dedup::resolve
