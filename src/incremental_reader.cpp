#include "incremental_reader.hpp"
#include "watch_errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace laralog {

namespace {
constexpr std::size_t kReadChunk = 64 * 1024;

// Closes the descriptor on every exit path.
struct FileDescriptor {
    int fd;
    explicit FileDescriptor(int f) : fd(f) {}
    ~FileDescriptor() {
        if (fd >= 0) ::close(fd);
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
};
}

IncrementalReader::IncrementalReader(std::size_t max_read_bytes)
    : max_read_bytes_(std::max<std::size_t>(max_read_bytes, 1))
{
}

std::string IncrementalReader::read_new_bytes(WatchCursor& cursor) {
    last_read_capped_ = false;
    last_read_replaced_ = false;

    FileDescriptor file(::open(cursor.file_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (file.fd < 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            throw FileNotFoundError(cursor.file_path);
        }
        throw TransientIOError("Failed to open " + cursor.file_path + ": " + std::strerror(err));
    }

    struct stat st {};
    if (::fstat(file.fd, &st) != 0) {
        throw TransientIOError("Failed to stat " + cursor.file_path + ": " + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        throw TransientIOError(cursor.file_path + " is not a regular file");
    }

    // The path may have been renamed over since the cursor's file was last seen.
    // Bytes from another file at this offset would be a torn entry, so read
    // nothing and let the next change check reset the cursor.
    FileIdentity opened{static_cast<std::uint64_t>(st.st_dev), static_cast<std::uint64_t>(st.st_ino)};
    if (opened != cursor.file_identity) {
        last_read_replaced_ = true;
        return {};
    }

    std::string bytes;
    char buffer[kReadChunk];
    while (bytes.size() < max_read_bytes_) {
        std::size_t want = std::min(kReadChunk, max_read_bytes_ - bytes.size());
        off_t at = static_cast<off_t>(cursor.offset + bytes.size());
        ssize_t got = ::pread(file.fd, buffer, want, at);
        if (got < 0) {
            if (errno == EINTR) continue;
            throw TransientIOError("Read failed on " + cursor.file_path + ": " + std::strerror(errno));
        }
        if (got == 0) {
            break;
        }
        bytes.append(buffer, static_cast<std::size_t>(got));
    }

    if (bytes.size() >= max_read_bytes_ &&
        cursor.offset + bytes.size() < static_cast<std::uint64_t>(st.st_size)) {
        last_read_capped_ = true;
    }

    cursor.offset += bytes.size();
    return bytes;
}

} // namespace laralog
