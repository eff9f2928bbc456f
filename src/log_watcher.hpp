#pragma once

#include "incremental_reader.hpp"
#include "log_record.hpp"
#include "severity_filter.hpp"
#include "watch_cursor.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace laralog {

struct WatchOptions {
    std::chrono::milliseconds poll_interval{500};
    bool start_at_end = false;  // default: read the whole file from offset 0
    std::size_t max_read_bytes = kDefaultMaxReadBytes;
};

enum class WatchEventKind {
    Started,
    Stopped,
    Truncated,
    Replaced,
    FileNotFound,  // the session has ended
    IOError        // transient, will retry
};

inline const char* watch_event_to_string(WatchEventKind k) {
    switch (k) {
        case WatchEventKind::Started: return "started";
        case WatchEventKind::Stopped: return "stopped";
        case WatchEventKind::Truncated: return "truncated";
        case WatchEventKind::Replaced: return "replaced";
        case WatchEventKind::FileNotFound: return "file-not-found";
        case WatchEventKind::IOError: return "io-error";
        default: return "?";
    }
}

struct WatchEvent {
    WatchEventKind kind;
    std::string path;
    std::string message;
};

// Tails one file on a background thread: polls metadata, reads what was
// appended, cuts it into entries, parses and filters them, and hands accepted
// records to the sink in file order. Callbacks run on the watch thread (events
// raised by start() itself fire on the caller's thread) and must not call
// start() or stop().
class LogWatcher {
public:
    using RecordSink = std::function<void(RecordPtr)>;
    using StatusCallback = std::function<void(const WatchEvent&)>;

    LogWatcher(const SeverityFilter& filter, RecordSink sink,
               StatusCallback status = nullptr, WatchOptions options = {});
    ~LogWatcher();

    LogWatcher(const LogWatcher&) = delete;
    LogWatcher& operator=(const LogWatcher&) = delete;

    // No-op returning true when already running. Returns false when the file
    // can't be stat'ed.
    bool start(const std::string& path);

    // No-op when not running. Returns once the final entry has been flushed
    // to the sink and the thread has exited.
    void stop();

    bool is_running() const { return running_; }
    std::string path() const;
    const WatchOptions& options() const { return options_; }

    std::uint64_t records_parsed() const { return records_parsed_; }
    std::uint64_t records_delivered() const { return records_delivered_; }

private:
    void monitor_loop(WatchCursor cursor);
    bool wait_for_next_poll();
    void deliver(std::vector<std::string> segments);
    void report(WatchEventKind kind, const std::string& path, const std::string& message);

    const SeverityFilter& filter_;
    RecordSink sink_;
    StatusCallback status_;
    WatchOptions options_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> records_parsed_{0};
    std::atomic<std::uint64_t> records_delivered_{0};

    std::mutex control_mutex_;  // serializes start/stop
    mutable std::mutex path_mutex_;
    std::string path_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool stop_requested_ = false;
};

} // namespace laralog
