#include "dedup/events/events.hpp"

namespace dedup::events {

const char* to_string(EntrySkippedEvent::Reason reason) noexcept {
    switch (reason) {
        case EntrySkippedEvent::Reason::Symlink: return "symlink";
        case EntrySkippedEvent::Reason::Filtered: return "filtered";
        case EntrySkippedEvent::Reason::ExcludedDirectory: return "excluded-directory";
        case EntrySkippedEvent::Reason::SpecialFile: return "special-file";
        case EntrySkippedEvent::Reason::IOError: return "io-error";
        case EntrySkippedEvent::Reason::HashFailed: return "hash-failed";
    }
    return "unknown";
}

} // namespace dedup::events
