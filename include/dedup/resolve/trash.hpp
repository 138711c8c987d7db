#pragma once

#include "dedup/core/result.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace dedup::resolve {

/**
 * @brief Recoverable deletion target
 *
 * Implementations move a file somewhere the user can restore it from; they
 * never unlink permanently.
 */
class TrashBin {
public:
    virtual ~TrashBin() = default;

    /// Move file into the trash and return where it ended up
    virtual Result<std::filesystem::path> move_to_trash(const std::filesystem::path& file) = 0;

    virtual std::filesystem::path location() const = 0;
};

/**
 * @brief freedesktop.org trash (Linux desktops)
 *
 * <root>/files/<name> holds the file, <root>/info/<name>.trashinfo records
 * the original path and deletion date so file managers can restore it.
 */
class XdgTrashBin final : public TrashBin {
public:
    explicit XdgTrashBin(std::filesystem::path root);

    Result<std::filesystem::path> move_to_trash(const std::filesystem::path& file) override;

    std::filesystem::path location() const override { return root_; }

    std::filesystem::path files_dir() const { return root_ / "files"; }
    std::filesystem::path info_dir() const { return root_ / "info"; }

    /// Percent-encode a path for the Path= key
    static std::string encode_path(const std::string& path);

private:
    std::filesystem::path root_;
};

/**
 * @brief ~/.Trash on macOS; name clashes get Finder-style " 2", " 3" suffixes
 */
class MacTrashBin final : public TrashBin {
public:
    explicit MacTrashBin(std::filesystem::path dir);

    Result<std::filesystem::path> move_to_trash(const std::filesystem::path& file) override;

    std::filesystem::path location() const override { return dir_; }

private:
    std::filesystem::path dir_;
};

/**
 * @brief Platform trash, or override_dir when given
 *
 * Linux: $XDG_DATA_HOME/Trash, else $HOME/.local/share/Trash.
 * macOS: $HOME/.Trash. Fails with InvalidArgument when HOME is unset.
 */
Result<std::unique_ptr<TrashBin>> make_default_trash(const std::optional<std::filesystem::path>& override_dir = std::nullopt);

/**
 * @brief rename(), falling back to copy + remove across filesystems
 */
Result<void> move_file(const std::filesystem::path& from, const std::filesystem::path& to);

} // namespace dedup::resolve
