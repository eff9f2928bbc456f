#include "log_watcher.hpp"
#include "app_log.hpp"
#include "change_detector.hpp"
#include "entry_parser.hpp"
#include "entry_segmenter.hpp"
#include "watch_errors.hpp"

namespace laralog {

LogWatcher::LogWatcher(const SeverityFilter& filter, RecordSink sink,
                       StatusCallback status, WatchOptions options)
    : filter_(filter)
    , sink_(std::move(sink))
    , status_(std::move(status))
    , options_(options)
{
}

LogWatcher::~LogWatcher() {
    stop();
}

std::string LogWatcher::path() const {
    std::lock_guard<std::mutex> lock(path_mutex_);
    return path_;
}

bool LogWatcher::start(const std::string& path) {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (running_) return true;

    // A previous session may have ended on its own (file removed).
    if (thread_.joinable()) {
        thread_.join();
    }

    ChangeDetector detector(path);
    FileSnapshot snapshot;
    try {
        snapshot = detector.snapshot();
    } catch (const FileNotFoundError& e) {
        AppLog::error("Watcher", e.what());
        report(WatchEventKind::FileNotFound, path, e.what());
        return false;
    } catch (const TransientIOError& e) {
        AppLog::error("Watcher", e.what());
        report(WatchEventKind::IOError, path, e.what());
        return false;
    }

    WatchCursor cursor;
    cursor.file_path = path;
    cursor.file_identity = snapshot.identity;
    cursor.offset = options_.start_at_end ? snapshot.size : 0;

    {
        std::lock_guard<std::mutex> lock(path_mutex_);
        path_ = path;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = false;
    }
    running_ = true;

    AppLog::log("Watcher", "Started watching: " + path + " (from offset " +
                std::to_string(cursor.offset) + ")");
    report(WatchEventKind::Started, path, "");

    thread_ = std::thread([this, cursor]() {
        monitor_loop(cursor);
    });
    return true;
}

void LogWatcher::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (!thread_.joinable()) return;

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();
    thread_.join();
}

bool LogWatcher::wait_for_next_poll() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, options_.poll_interval, [this]() { return stop_requested_; });
    return !stop_requested_;
}

void LogWatcher::monitor_loop(WatchCursor cursor) {
    ChangeDetector detector(cursor.file_path);
    IncrementalReader reader(options_.max_read_bytes);
    EntrySegmenter segmenter;

    // First pass runs immediately so existing content shows up without waiting a full interval.
    bool poll_now = true;

    while (true) {
        if (!poll_now && !wait_for_next_poll()) {
            break;
        }
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            if (stop_requested_) break;
        }
        poll_now = false;

        try {
            ChangeEvent change = detector.poll(cursor);

            if (change.kind == ChangeKind::Unchanged) {
                continue;
            }

            if (change.kind == ChangeKind::Truncated || change.kind == ChangeKind::Replaced) {
                bool truncated = change.kind == ChangeKind::Truncated;
                std::string message = std::string(truncated ? "File truncated" : "File replaced") +
                                      ", resetting position: " + cursor.file_path;
                if (segmenter.has_pending()) {
                    message += " (discarded " + std::to_string(segmenter.pending_bytes()) +
                               " pending bytes)";
                }
                AppLog::log("Watcher", message);

                cursor.reset(change.snapshot.identity);
                segmenter.reset();
                report(truncated ? WatchEventKind::Truncated : WatchEventKind::Replaced,
                       cursor.file_path, message);

                if (change.snapshot.size == 0) {
                    continue;
                }
            }

            std::string bytes = reader.read_new_bytes(cursor);
            deliver(segmenter.feed(bytes));

            // A capped read leaves a backlog and a swapped file needs a reset;
            // either way go again without sleeping.
            poll_now = reader.last_read_capped() || reader.last_read_replaced();
        } catch (const FileNotFoundError& e) {
            AppLog::error("Watcher", e.what());
            deliver(segmenter.flush());
            running_ = false;
            report(WatchEventKind::FileNotFound, cursor.file_path, e.what());
            return;
        } catch (const TransientIOError& e) {
            AppLog::error("Watcher", std::string("Read failed, retrying: ") + e.what());
            report(WatchEventKind::IOError, cursor.file_path, e.what());
        }
    }

    // Stop requested: whatever is buffered is the last entry.
    deliver(segmenter.flush());
    running_ = false;
    AppLog::log("Watcher", "Stopped watching: " + cursor.file_path);
    report(WatchEventKind::Stopped, cursor.file_path, "");
}

void LogWatcher::deliver(std::vector<std::string> segments) {
    for (auto& segment : segments) {
        LogRecord record = parse_entry(segment);
        ++records_parsed_;

        // One snapshot per record, so a concurrent toggle applies from the next record on.
        if (!filter_.accept(record)) {
            continue;
        }

        try {
            sink_(std::make_shared<const LogRecord>(std::move(record)));
            ++records_delivered_;
        } catch (const std::exception& e) {
            AppLog::error("Watcher", std::string("Record sink failed: ") + e.what());
        }
    }
}

void LogWatcher::report(WatchEventKind kind, const std::string& path, const std::string& message) {
    if (!status_) return;
    try {
        status_(WatchEvent{kind, path, message});
    } catch (const std::exception& e) {
        AppLog::error("Watcher", std::string("Status callback failed: ") + e.what());
    }
}

} // namespace laralog
