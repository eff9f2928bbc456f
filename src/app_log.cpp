#include "app_log.hpp"
#include <ctime>
#include <iostream>

namespace laralog {

AppLog::Sink AppLog::sink_ = AppLog::console_sink;
std::mutex AppLog::mutex_;

AppLog::ScopedSink::ScopedSink(Sink sink) {
    AppLog::set_sink(std::move(sink));
}

AppLog::ScopedSink::~ScopedSink() {
    AppLog::set_sink(nullptr);
}

void AppLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : console_sink;
}

void AppLog::log(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(component, message, false);
    }
}

void AppLog::error(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(component, message, true);
    }
}

void AppLog::console_sink(const std::string& component,
                          const std::string& message, bool is_error) {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &local);

    std::ostream& out = is_error ? std::cerr : std::clog;
    out << stamp << " [" << component << "] " << (is_error ? "error: " : "") << message << std::endl;
}

} // namespace laralog
