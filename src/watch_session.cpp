#include "watch_session.hpp"
#include "app_log.hpp"
#include <filesystem>
#include <stdexcept>

namespace laralog {

WatchSession::WatchSession(WatchOptions options, const FilterState& initial_filter,
                           RecentFiles* recent)
    : filter_(initial_filter)
    , recent_(recent)
{
    watcher_ = std::make_unique<LogWatcher>(
        filter_,
        [this](RecordPtr record) { queue_.push(std::move(record)); },
        [this](const WatchEvent& event) { on_status(event); },
        options);
}

WatchSession::~WatchSession() {
    stop_watching();
}

void WatchSession::set_status_callback(LogWatcher::StatusCallback callback) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_ = std::move(callback);
}

void WatchSession::on_status(const WatchEvent& event) {
    LogWatcher::StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        callback = status_;
    }
    if (callback) {
        callback(event);
    }
}

bool WatchSession::start_watching(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (watcher_->is_running()) {
        if (watcher_->path() != path) {
            AppLog::log("Session", "Already watching " + watcher_->path() + ", ignoring start for " + path);
        }
        return true;
    }

    current_file_ = path;
    if (!watcher_->start(path)) {
        return false;
    }
    remember(path);
    return true;
}

void WatchSession::remember(const std::string& path) {
    if (recent_ && !recent_->add(path)) {
        AppLog::error("Session", "Could not record " + path + " in recent files");
    }
}

bool WatchSession::start_watching() {
    std::string path = current_file();
    if (path.empty()) {
        AppLog::error("Session", "No log file selected");
        return false;
    }
    return start_watching(path);
}

void WatchSession::stop_watching() {
    std::lock_guard<std::mutex> lock(mutex_);
    watcher_->stop();
}

bool WatchSession::set_current_file(const std::string& path) {
    bool restart = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (path == current_file_ && watcher_->is_running()) {
            return true;
        }
        restart = watcher_->is_running();
        if (restart) {
            watcher_->stop();
        }
        current_file_ = path;
    }
    if (restart) {
        return start_watching(path);
    }
    remember(path);
    return true;
}

bool WatchSession::is_watching() const {
    return watcher_->is_running();
}

std::string WatchSession::current_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_file_;
}

void WatchSession::set_severity_enabled(Severity severity, bool enabled) {
    filter_.set_enabled(severity, enabled);
}

bool WatchSession::severity_enabled(Severity severity) const {
    return filter_.is_enabled(severity);
}

void WatchSession::empty_log_file() {
    std::string path = current_file();
    if (path.empty()) {
        throw std::runtime_error("No log file selected");
    }

    std::error_code ec;
    std::filesystem::resize_file(path, 0, ec);
    if (ec) {
        throw std::runtime_error("Failed to empty " + path + ": " + ec.message());
    }
    AppLog::log("Session", "Emptied log file: " + path);
}

ScopedStatusCallback::ScopedStatusCallback(WatchSession& session,
                                           LogWatcher::StatusCallback callback)
    : session_(session)
{
    session_.set_status_callback(std::move(callback));
}

ScopedStatusCallback::~ScopedStatusCallback() {
    session_.set_status_callback(nullptr);
    session_.stop_watching();
}

} // namespace laralog
