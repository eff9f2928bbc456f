#pragma once

#include <stdexcept>
#include <string>

namespace laralog {

// The watched file is gone. Ends the watch session.
class FileNotFoundError : public std::runtime_error {
public:
    explicit FileNotFoundError(const std::string& path)
        : std::runtime_error("File not found: " + path)
        , path_(path)
    {
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// A stat or read failed this cycle. The watcher retries on the next poll.
class TransientIOError : public std::runtime_error {
public:
    explicit TransientIOError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

} // namespace laralog
