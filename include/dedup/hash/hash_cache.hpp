#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace dedup::hash {

/**
 * @brief path -> fingerprint memo for one scanning session
 *
 * Construct one per session and hand it to the HashEngine; never share it
 * between sessions. A hit is returned even if the file changed after it was
 * hashed: staleness is not detected.
 *
 * Safe for concurrent lookup/store from hash workers.
 */
class HashCache {
public:
    HashCache() = default;

    HashCache(const HashCache&) = delete;
    HashCache& operator=(const HashCache&) = delete;

    [[nodiscard]] std::optional<std::string> lookup(const std::string& path) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(path);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// First writer wins; a later store for the same path is ignored
    void store(const std::string& path, std::string fingerprint) {
        std::unique_lock lock(mutex_);
        entries_.emplace(path, std::move(fingerprint));
    }

    [[nodiscard]] bool contains(const std::string& path) const {
        std::shared_lock lock(mutex_);
        return entries_.count(path) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> entries_;
};

} // namespace dedup::hash
