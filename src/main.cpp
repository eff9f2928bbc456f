#include "app_log.hpp"
#include "console_ui.hpp"
#include "recent_files.hpp"
#include "session_store.hpp"
#include "severity_filter.hpp"
#include "watch_session.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace laralog;

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

void print_usage(const char* program) {
    std::cout << "LaraLog - live viewer for Laravel-style application logs\n\n";
    std::cout << "Usage: " << program << " [options] [FILE]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --file PATH            Log file to watch (same as FILE)\n";
    std::cout << "  --poll-ms N            Poll interval in milliseconds (default: 500)\n";
    std::cout << "  --tail                 Start at the end of the file instead of the beginning\n";
    std::cout << "  --levels LIST          Enabled levels, e.g. error,warning (default: all)\n";
    std::cout << "  --config PATH          Recent files list (default: ./laralog.config)\n";
    std::cout << "  --max-read-bytes N     Bytes consumed per poll at most (default: 1048576)\n";
    std::cout << "  --headless             No UI, print records to stdout\n";
    std::cout << "  --json                 With --headless, print records as JSON lines\n";
    std::cout << "  --help                 Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program << " --levels error,critical storage/logs/laravel.log\n";
}

void print_record(const LogRecord& record, bool as_json) {
    if (as_json) {
        std::cout << record.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return;
    }

    std::string level = severity_to_string(record.severity);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    std::cout << "[" << (record.timestamp_text.empty() ? "-" : record.timestamp_text) << "] "
              << level << ": " << record.summary << "\n";
    for (const auto& line : record.body) {
        std::cout << "    " << line << "\n";
    }
    std::cout << std::flush;
}

int run_headless(WatchSession& session, const std::string& file, bool as_json) {
    if (file.empty()) {
        std::cerr << "--headless needs a file to watch" << std::endl;
        return 1;
    }

    std::atomic<bool> lost_file{false};
    ScopedStatusCallback status(session, [&lost_file](const WatchEvent& event) {
        if (event.kind == WatchEventKind::FileNotFound) {
            lost_file = true;
        }
    });

    if (!session.start_watching(file)) {
        return 1;
    }

    while (running && !lost_file) {
        if (RecordPtr record = session.queue().wait_pop(std::chrono::milliseconds(100))) {
            print_record(*record, as_json);
        }
    }

    session.stop_watching();
    // The final entry is flushed on stop.
    for (const auto& record : session.queue().drain()) {
        print_record(*record, as_json);
    }
    return lost_file ? 2 : 0;
}

int main(int argc, char* argv[]) {
    WatchOptions options;
    FilterState filter;
    std::string file;
    std::string config_path = RecentFiles::default_config_path();
    bool headless = false;
    bool as_json = false;

    // Parse command line arguments
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            }
            else if (arg == "--file" && i + 1 < argc) {
                file = argv[++i];
            }
            else if (arg == "--poll-ms" && i + 1 < argc) {
                int ms = std::stoi(argv[++i]);
                options.poll_interval = std::chrono::milliseconds(std::clamp(ms, 50, 5000));
            }
            else if (arg == "--tail") {
                options.start_at_end = true;
            }
            else if (arg == "--levels" && i + 1 < argc) {
                std::vector<std::string> rejected;
                filter = FilterState::from_list(argv[++i], &rejected);
                for (const auto& name : rejected) {
                    std::cerr << "Ignoring unknown level: " << name << std::endl;
                }
            }
            else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            }
            else if (arg == "--max-read-bytes" && i + 1 < argc) {
                long long n = std::stoll(argv[++i]);
                options.max_read_bytes = static_cast<std::size_t>(std::max(4096LL, n));
            }
            else if (arg == "--headless") {
                headless = true;
            }
            else if (arg == "--json") {
                as_json = true;
            }
            else if (!arg.empty() && arg[0] != '-' && file.empty()) {
                file = arg;
            }
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        RecentFiles recent(config_path);
        recent.load();

        WatchSession session(options, filter, &recent);

        if (headless) {
            return run_headless(session, file, as_json);
        }

        SessionStore store;
        ConsoleUI ui(session, store, recent);
        // Unwound before ui on every exit path, exceptions included.
        AppLog::ScopedSink log_to_ui(ui.get_log_sink());
        ScopedStatusCallback status(session, [&ui](const WatchEvent& event) {
            ui.on_watch_event(event);
        });

        if (!file.empty() && !session.start_watching(file)) {
            AppLog::error("Main", "Could not watch " + file + ", use /open <path>");
        }

        ui.run(running);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
