#pragma once

#include "watch_cursor.hpp"
#include <cstdint>
#include <string>

namespace laralog {

enum class ChangeKind {
    Unchanged,
    Grown,
    Truncated,  // same file, size dropped below the cursor
    Replaced    // different file now lives at the path
};

inline const char* change_kind_to_string(ChangeKind k) {
    switch (k) {
        case ChangeKind::Unchanged: return "unchanged";
        case ChangeKind::Grown: return "grown";
        case ChangeKind::Truncated: return "truncated";
        case ChangeKind::Replaced: return "replaced";
        default: return "?";
    }
}

struct FileSnapshot {
    std::uint64_t size = 0;
    std::int64_t mtime_ns = 0;
    FileIdentity identity;
};

struct ChangeEvent {
    ChangeKind kind = ChangeKind::Unchanged;
    std::uint64_t grown_by = 0;
    FileSnapshot snapshot;
};

// Read-only metadata check of a single path. Polled on an interval by the
// watch loop; it never opens the file.
class ChangeDetector {
public:
    explicit ChangeDetector(const std::string& path);

    // Throws FileNotFoundError when the path is gone, TransientIOError on
    // any other stat failure.
    FileSnapshot snapshot() const;

    ChangeEvent poll(const WatchCursor& cursor) const;

    // Pure classification of a snapshot against the cursor.
    static ChangeEvent classify(const WatchCursor& cursor, const FileSnapshot& snapshot);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace laralog
