#include "dedup/scan/scanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <utility>

namespace dedup::scan {
namespace fs = std::filesystem;

using events::EntrySkippedEvent;

FileFilter ScanOptions::make_filter() const {
    return FileFilter(file_types, exclude_dirs, use_default_excludes);
}

DirectoryScanner::DirectoryScanner(FileFilter filter, events::EventBus* bus, bool estimate_total)
    : filter_(std::move(filter)), bus_(bus), estimate_total_(estimate_total) {}

DirectoryScanner::DirectoryScanner(const ScanOptions& options, events::EventBus* bus)
    : DirectoryScanner(options.make_filter(), bus, options.estimate_total) {}

Result<ScanSummary> DirectoryScanner::scan(const fs::path& root, const RecordSink& sink) {
    summary_ = ScanSummary{};

    std::error_code ec;
    if (root.empty() || !fs::exists(root, ec)) {
        return Err<ScanSummary>(make_error(ErrorKind::InvalidArgument,
                                           "Directory does not exist: " + root.string(),
                                           root.string()));
    }
    if (!fs::is_directory(root, ec)) {
        return Err<ScanSummary>(make_error(ErrorKind::InvalidArgument,
                                           "Path is not a directory: " + root.string(),
                                           root.string()));
    }

    root_ = fs::canonical(root, ec);
    if (ec) {
        return Err<ScanSummary>(error_from_code(ec, root.string(), "Cannot resolve scan root"));
    }

    fs::directory_iterator root_listing(root_, ec);
    if (ec) {
        return Err<ScanSummary>(error_from_code(ec, root_.string(), "Cannot scan directory"));
    }

    estimated_total_ = estimate_total_ ? estimate_total(root_) : 0;
    file_clock_origin_ = fs::file_time_type::clock::now();
    system_clock_origin_ = std::chrono::system_clock::now();
    const auto started = std::chrono::steady_clock::now();
    last_progress_ = started;

    if (bus_ != nullptr) {
        bus_->emit(events::ScanStartedEvent(root_.string(), estimated_total_));
    }

    std::vector<fs::path> pending;
    bool keep_going = walk_directory(root_, std::move(root_listing), pending, sink);

    while (keep_going && !pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        fs::directory_iterator listing(dir, ec);
        if (ec) {
            summary_.errors++;
            skip(dir, EntrySkippedEvent::Reason::IOError,
                 error_from_code(ec, dir.string(), "Cannot list directory"));
            continue;
        }
        keep_going = walk_directory(dir, std::move(listing), pending, sink);
    }

    summary_.stopped_early = !keep_going;

    if (bus_ != nullptr) {
        events::ScanCompletedEvent completed;
        completed.root = root_.string();
        completed.summary = summary_;
        completed.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        bus_->emit(completed);
    }

    return Ok(summary_);
}

Result<std::vector<FileRecord>> DirectoryScanner::collect(const fs::path& root) {
    std::vector<FileRecord> records;
    auto result = scan(root, [&records](const FileRecord& record) {
        records.push_back(record);
        return true;
    });
    if (result.is_error()) {
        return Err<std::vector<FileRecord>>(result.error());
    }
    return Ok(std::move(records));
}

std::size_t DirectoryScanner::estimate_total(const fs::path& root) {
    std::size_t count = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return 0;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code status_ec;
        if (fs::is_regular_file(it->symlink_status(status_ec)) && !status_ec) {
            ++count;
        }
    }
    if (ec) {
        spdlog::debug("Estimate for {} stopped early: {}", root.string(), ec.message());
    }
    return count;
}

bool DirectoryScanner::walk_directory(const fs::path& dir,
                                      fs::directory_iterator it,
                                      std::vector<fs::path>& pending,
                                      const RecordSink& sink) {
    std::vector<fs::path> subdirs;
    std::error_code ec;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (!visit_entry(*it, dir, subdirs, sink)) {
            return false;
        }
    }
    if (ec) {
        // The rest of this listing is lost; siblings elsewhere are unaffected
        summary_.errors++;
        skip(dir, EntrySkippedEvent::Reason::IOError,
             error_from_code(ec, dir.string(), "Directory listing failed"));
    }

    // Stack is LIFO: push in reverse so subdirectories are visited in listing order
    for (auto sub = subdirs.rbegin(); sub != subdirs.rend(); ++sub) {
        pending.push_back(std::move(*sub));
    }
    return true;
}

bool DirectoryScanner::visit_entry(const fs::directory_entry& entry,
                                   const fs::path& dir,
                                   std::vector<fs::path>& subdirs,
                                   const RecordSink& sink) {
    const fs::path& path = entry.path();
    std::error_code ec;

    const auto status = entry.symlink_status(ec);
    if (ec) {
        summary_.errors++;
        skip(path, EntrySkippedEvent::Reason::IOError, error_from_code(ec, path.string(), "Cannot stat"));
        return true;
    }

    if (fs::is_symlink(status)) {
        summary_.skipped_symlinks++;
        skip(path, EntrySkippedEvent::Reason::Symlink);
        return true;
    }

    if (fs::is_directory(status)) {
        if (filter_.is_excluded_directory(path.filename().string())) {
            summary_.excluded_dirs++;
            skip(path, EntrySkippedEvent::Reason::ExcludedDirectory);
        } else {
            subdirs.push_back(path);
        }
        return true;
    }

    if (!fs::is_regular_file(status)) {
        summary_.skipped_special++;
        skip(path, EntrySkippedEvent::Reason::SpecialFile);
        return true;
    }

    if (!filter_.should_include_file(path)) {
        summary_.filtered++;
        skip(path, EntrySkippedEvent::Reason::Filtered);
        return true;
    }

    // Stat again: the file may have vanished since it was listed
    const auto size = fs::file_size(path, ec);
    if (ec) {
        summary_.errors++;
        skip(path, EntrySkippedEvent::Reason::IOError, error_from_code(ec, path.string(), "Cannot stat"));
        return true;
    }
    const auto write_time = fs::last_write_time(path, ec);
    if (ec) {
        summary_.errors++;
        skip(path, EntrySkippedEvent::Reason::IOError, error_from_code(ec, path.string(), "Cannot stat"));
        return true;
    }

    FileRecord record;
    record.path = path.string();
    record.size = size;
    record.mtime = to_epoch_seconds(write_time);
    record.is_symlink = false;

    summary_.processed++;
    report_progress(dir);

    return sink(record);
}

double DirectoryScanner::to_epoch_seconds(fs::file_time_type time) const {
    using seconds = std::chrono::duration<double>;
    const auto since_origin = std::chrono::duration_cast<seconds>(time - file_clock_origin_);
    const auto origin = std::chrono::duration_cast<seconds>(system_clock_origin_.time_since_epoch());
    return origin.count() + since_origin.count();
}

void DirectoryScanner::skip(const fs::path& path,
                            EntrySkippedEvent::Reason reason,
                            std::optional<Error> error) {
    if (bus_ == nullptr) {
        if (error) {
            spdlog::debug("Skipping {}: {}", path.string(), error->describe());
        }
        return;
    }
    EntrySkippedEvent event;
    event.path = path.string();
    event.reason = reason;
    event.error = std::move(error);
    bus_->emit(event);
}

void DirectoryScanner::report_progress(const fs::path& current_dir) {
    if (bus_ == nullptr) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    const bool due = summary_.processed % kProgressEveryFiles == 0 ||
                     now - last_progress_ >= kProgressInterval;
    if (!due) {
        return;
    }
    last_progress_ = now;

    events::ScanProgressEvent progress;
    progress.processed = summary_.processed;
    progress.estimated_total = estimated_total_;
    if (estimated_total_ > 0) {
        progress.percent = static_cast<int>(std::min<std::size_t>(100, summary_.processed * 100 / estimated_total_));
    }
    progress.current_dir = current_dir.lexically_relative(root_).string();
    bus_->emit(progress);
}

} // namespace dedup::scan
