#pragma once

#include <cstdint>
#include <string>

namespace laralog {

// Device + inode pair. Changes when the path is re-created (rotation),
// stays the same when the file is truncated in place.
struct FileIdentity {
    std::uint64_t device = 0;
    std::uint64_t inode = 0;

    bool operator==(const FileIdentity& other) const {
        return device == other.device && inode == other.inode;
    }
    bool operator!=(const FileIdentity& other) const { return !(*this == other); }
};

// Read progress into one file. Owned by the watch thread only.
struct WatchCursor {
    std::string file_path;
    std::uint64_t offset = 0;
    FileIdentity file_identity;

    void reset(const FileIdentity& identity) {
        offset = 0;
        file_identity = identity;
    }
};

} // namespace laralog
