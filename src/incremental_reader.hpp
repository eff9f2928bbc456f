#pragma once

#include "watch_cursor.hpp"
#include <cstddef>
#include <string>

namespace laralog {

constexpr std::size_t kDefaultMaxReadBytes = 1024 * 1024;

// Reads the bytes appended past cursor.offset. The file is opened and closed
// on every call; only the cursor carries state between reads.
class IncrementalReader {
public:
    explicit IncrementalReader(std::size_t max_read_bytes = kDefaultMaxReadBytes);

    // Returns at most max_read_bytes and advances cursor.offset by the amount
    // returned. Throws FileNotFoundError / TransientIOError, leaving the cursor
    // untouched. Reads nothing when the file at the path is no longer the one
    // cursor.file_identity names.
    std::string read_new_bytes(WatchCursor& cursor);

    // True when the last read stopped at the cap rather than at end-of-file.
    bool last_read_capped() const { return last_read_capped_; }

    // True when the last read found a different file behind the path.
    bool last_read_replaced() const { return last_read_replaced_; }

    std::size_t max_read_bytes() const { return max_read_bytes_; }

private:
    std::size_t max_read_bytes_;
    bool last_read_capped_ = false;
    bool last_read_replaced_ = false;
};

} // namespace laralog
