#pragma once

#include "log_watcher.hpp"
#include "record_queue.hpp"
#include "recent_files.hpp"
#include "severity_filter.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace laralog {

// Start/stop, filter and file controls for the one file being watched.
// Accepted records land in queue(), in file order.
class WatchSession {
public:
    explicit WatchSession(WatchOptions options = {},
                          const FilterState& initial_filter = FilterState(),
                          RecentFiles* recent = nullptr);
    ~WatchSession();

    WatchSession(const WatchSession&) = delete;
    WatchSession& operator=(const WatchSession&) = delete;

    // Runs on the watch thread; must not call back into the session.
    void set_status_callback(LogWatcher::StatusCallback callback);

    // No-op when already watching. A successful start is recorded in the
    // recent files list.
    bool start_watching(const std::string& path);
    bool start_watching();  // current file
    void stop_watching();

    // Selects a file and records it in the recent files list; restarts on it
    // when a different file is being watched.
    bool set_current_file(const std::string& path);

    bool is_watching() const;
    std::string current_file() const;

    void set_severity_enabled(Severity severity, bool enabled);
    bool severity_enabled(Severity severity) const;

    // Truncates the current file to zero length. The watcher picks this up as
    // a truncation on its next poll. Throws std::runtime_error on failure.
    void empty_log_file();

    RecordQueue& queue() { return queue_; }
    const SeverityFilter& filter() const { return filter_; }
    const LogWatcher& watcher() const { return *watcher_; }

private:
    void on_status(const WatchEvent& event);
    void remember(const std::string& path);

    SeverityFilter filter_;
    RecordQueue queue_;
    RecentFiles* recent_;

    std::mutex status_mutex_;
    LogWatcher::StatusCallback status_;

    mutable std::mutex mutex_;
    std::string current_file_;
    std::unique_ptr<LogWatcher> watcher_;
};

// Holds a status callback on a session for its lifetime. Destruction removes
// the callback before stopping the watch, so the watch thread's last events
// never reach an owner that is already gone. Declare it after that owner.
class ScopedStatusCallback {
public:
    ScopedStatusCallback(WatchSession& session, LogWatcher::StatusCallback callback);
    ~ScopedStatusCallback();

    ScopedStatusCallback(const ScopedStatusCallback&) = delete;
    ScopedStatusCallback& operator=(const ScopedStatusCallback&) = delete;

private:
    WatchSession& session_;
};

} // namespace laralog
