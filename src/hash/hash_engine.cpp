#include "dedup/hash/hash_engine.hpp"

#include "dedup/events/events.hpp"
#include "dedup/hash/sha256.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace dedup::hash {
namespace fs = std::filesystem;

namespace {

Error open_error(const std::string& path) {
    const int err = errno;
    if (err != 0) {
        return error_from_code(std::error_code(err, std::generic_category()), path, "Cannot open file");
    }
    return make_error(ErrorKind::GenericIOFailure, "Cannot open file: " + path, path);
}

} // namespace

HashEngine::HashEngine(HashCache& cache, HashOptions options, events::EventBus* bus)
    : cache_(cache), options_(options), bus_(bus) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = HashOptions{}.chunk_size;
    }
    if (options_.workers == 0) {
        options_.workers = 1;
    }
}

Result<std::string> HashEngine::digest(const std::string& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return Err<std::string>(make_error(ErrorKind::NotFound, "File not found: " + path, path));
    }
    if (ec) {
        return Err<std::string>(error_from_code(ec, path, "Cannot stat"));
    }
    if (!fs::is_regular_file(status)) {
        return Err<std::string>(make_error(ErrorKind::PathKindMismatch, "Path is not a file: " + path, path));
    }

    if (auto cached = cache_.lookup(path)) {
        return Ok(std::move(*cached));
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::string>(error_from_code(ec, path, "Cannot stat"));
    }

    // Small files are read in a single block, large ones in bounded chunks
    const std::size_t buffer_size = size > options_.chunk_threshold
        ? options_.chunk_size
        : static_cast<std::size_t>(std::max<std::uintmax_t>(size, 1));

    auto result = hash_file(path, buffer_size);
    if (result.is_ok()) {
        cache_.store(path, result.value());
    }
    return result;
}

Result<std::string> HashEngine::hash_file(const std::string& path, std::size_t buffer_size) const {
    errno = 0;
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(open_error(path));
    }

    Sha256 hasher;
    std::vector<char> buffer(buffer_size);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (auto res = hasher.update(buffer.data(), count); res.is_error()) {
            return Err<std::string>(res.error());
        }
    }
    if (input.bad()) {
        return Err<std::string>(make_error(ErrorKind::GenericIOFailure, "Error reading file " + path, path));
    }

    return hasher.finish();
}

DuplicateMap HashEngine::find_duplicates(const std::vector<FileRecord>& records,
                                         const ProgressObserver& observer) {
    stats_ = HashStats{};
    stats_.input_files = records.size();

    DuplicateMap duplicates;
    if (records.empty()) {
        return duplicates;
    }

    // Phase 1: a file can only duplicate another file of the same size
    std::unordered_map<std::uintmax_t, std::size_t> size_counts;
    for (const auto& record : records) {
        ++size_counts[record.size];
    }

    std::vector<const FileRecord*> candidates;
    for (const auto& record : records) {
        if (size_counts[record.size] >= 2) {
            candidates.push_back(&record);
        } else {
            ++stats_.unique_sizes;
        }
    }
    stats_.candidates = candidates.size();

    spdlog::debug("Size pre-filter: {} of {} files need hashing", candidates.size(), records.size());

    // Phase 2: fingerprint the survivors
    auto digests = hash_candidates(candidates, observer);

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const FileRecord& record = *candidates[i];
        const auto& result = digests[i];
        if (result.is_error()) {
            ++stats_.failures;
            spdlog::warn("Skipping {}: {}", record.path, result.error().describe());
            if (bus_ != nullptr) {
                events::EntrySkippedEvent skipped;
                skipped.path = record.path;
                skipped.reason = events::EntrySkippedEvent::Reason::HashFailed;
                skipped.error = result.error();
                bus_->emit(skipped);
            }
            continue;
        }

        ++stats_.hashed;
        auto& group = duplicates[result.value()];
        if (group.members.empty()) {
            group.fingerprint = result.value();
            group.size = record.size;
        }
        group.members.push_back(record);
    }

    for (auto it = duplicates.begin(); it != duplicates.end();) {
        if (it->second.members.size() < 2) {
            it = duplicates.erase(it);
            continue;
        }
        if (bus_ != nullptr) {
            bus_->emit(events::DuplicateGroupFoundEvent{it->first, it->second.size, it->second.members.size()});
        }
        ++it;
    }
    stats_.groups = duplicates.size();

    spdlog::debug("Hashed {} files ({} failed), {} duplicate groups",
                  stats_.hashed, stats_.failures, stats_.groups);
    return duplicates;
}

std::vector<Result<std::string>> HashEngine::hash_candidates(const std::vector<const FileRecord*>& candidates,
                                                             const ProgressObserver& observer) {
    const std::size_t total = candidates.size();
    std::vector<std::optional<Result<std::string>>> slots(total);

    std::atomic<std::size_t> completed{0};
    std::mutex progress_mutex;
    int last_percent = 0;

    // Percentages come from the shared counter, so completion order does not matter
    auto on_done = [&]() {
        // Held across the observer and emit so updates arrive in percent order
        std::lock_guard lock(progress_mutex);
        const std::size_t done = completed.fetch_add(1) + 1;
        const int percent = std::max(last_percent, static_cast<int>(done * 100 / total));
        last_percent = percent;
        if (observer) {
            observer(percent);
        }
        if (bus_ != nullptr) {
            bus_->emit(events::HashProgressEvent{done, total, percent});
        }
    };

    if (options_.workers <= 1 || total < 2) {
        for (std::size_t i = 0; i < total; ++i) {
            slots[i].emplace(digest(candidates[i]->path));
            on_done();
        }
    } else {
        boost::asio::thread_pool pool(std::min(options_.workers, total));
        for (std::size_t i = 0; i < total; ++i) {
            boost::asio::post(pool, [this, &slots, &candidates, &on_done, i]() {
                slots[i].emplace(digest(candidates[i]->path));
                on_done();
            });
        }
        pool.join();
    }

    std::vector<Result<std::string>> results;
    results.reserve(total);
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

} // namespace dedup::hash
