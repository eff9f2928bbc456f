#include "change_detector.hpp"
#include "watch_errors.hpp"
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace laralog {

ChangeDetector::ChangeDetector(const std::string& path)
    : path_(path)
{
}

FileSnapshot ChangeDetector::snapshot() const {
    struct stat st;
    if (::stat(path_.c_str(), &st) != 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            throw FileNotFoundError(path_);
        }
        throw TransientIOError("Failed to stat " + path_ + ": " + std::strerror(err));
    }
    if (!S_ISREG(st.st_mode)) {
        throw TransientIOError("Not a regular file: " + path_);
    }

    FileSnapshot current;
    current.size = static_cast<std::uint64_t>(st.st_size);
    current.mtime_ns = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
                        static_cast<std::int64_t>(st.st_mtim.tv_nsec);
    current.identity.device = static_cast<std::uint64_t>(st.st_dev);
    current.identity.inode = static_cast<std::uint64_t>(st.st_ino);
    return current;
}

ChangeEvent ChangeDetector::poll(const WatchCursor& cursor) const {
    return classify(cursor, snapshot());
}

ChangeEvent ChangeDetector::classify(const WatchCursor& cursor, const FileSnapshot& snapshot) {
    ChangeEvent event;
    event.snapshot = snapshot;

    // Identity wins over size: a rotated file of equal size is still new content.
    if (snapshot.identity != cursor.file_identity) {
        event.kind = ChangeKind::Replaced;
    } else if (snapshot.size < cursor.offset) {
        event.kind = ChangeKind::Truncated;
    } else if (snapshot.size > cursor.offset) {
        event.kind = ChangeKind::Grown;
        event.grown_by = snapshot.size - cursor.offset;
    } else {
        event.kind = ChangeKind::Unchanged;
    }
    return event;
}

} // namespace laralog
