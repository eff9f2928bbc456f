#pragma once

#include <string>
#include <functional>
#include <mutex>

namespace laralog {

// Global application log sink. The TUI swaps in its activity pane;
// headless mode keeps the console sink.
class AppLog {
public:
    using Sink = std::function<void(const std::string& component,
                                     const std::string& message,
                                     bool is_error)>;

    // Routes AppLog to a sink until destroyed, then back to the console.
    // Declare it after the object the sink points into.
    class ScopedSink {
    public:
        explicit ScopedSink(Sink sink);
        ~ScopedSink();

        ScopedSink(const ScopedSink&) = delete;
        ScopedSink& operator=(const ScopedSink&) = delete;
    };

    static void set_sink(Sink sink);
    static void log(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    // Writes to clog, errors to cerr, with a local time prefix
    static void console_sink(const std::string& component,
                             const std::string& message, bool is_error);

private:
    static Sink sink_;
    static std::mutex mutex_;
};

} // namespace laralog
