#pragma once

#include "log_record.hpp"
#include "recent_files.hpp"
#include "session_store.hpp"
#include "watch_session.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace laralog {

class ConsoleUI;

// Slash command definition
struct SlashCommand {
    std::string name;
    std::string description;
    std::function<void(ConsoleUI&, const std::vector<std::string>&)> handler;
    bool accepts_args = false;  // If true, command can receive arguments
};

// Activity pane line (from AppLog capture)
struct ActivityLine {
    std::string component;
    std::string message;
    bool is_error;
    std::chrono::steady_clock::time_point timestamp;
};

// Thread-safe bounded buffer for the activity pane
class ActivityBuffer {
public:
    explicit ActivityBuffer(size_t max_lines = 500);
    void push(ActivityLine line);
    std::vector<ActivityLine> get_lines() const;
    size_t size() const;
    void clear();
private:
    mutable std::mutex mutex_;
    std::deque<ActivityLine> lines_;
    size_t max_lines_;
};

// Main TUI: severity checkboxes, record table, details pane, command bar.
class ConsoleUI {
public:
    ConsoleUI(WatchSession& session, SessionStore& store, RecentFiles& recent);
    ~ConsoleUI();

    // Start the TUI (blocks until exit)
    void run(std::atomic<bool>& running);

    // Adds a line to the activity pane
    void log_activity(const std::string& component, const std::string& message,
                      bool is_error = false);

    // Sink for AppLog while the TUI owns the terminal
    using ActivitySink = std::function<void(const std::string&, const std::string&, bool)>;
    ActivitySink get_log_sink();

    // Watch status events, called from the watch thread
    void on_watch_event(const WatchEvent& event);

private:
    // Moves queued records into the store; returns true when anything arrived.
    bool ingest_pending();
    void refresh_rows();
    void clear_display();
    void open_file(const std::string& path);
    void toggle_watching();
    void request_empty_log();
    void confirm_empty_log();
    void move_selection(int delta);
    void request_redraw();

    ftxui::Color severity_to_color(Severity s);
    std::string format_row_time(const LogRecord& record);

    // Command handling
    void init_commands(std::atomic<bool>& running, ftxui::ScreenInteractive& screen);
    void execute_command();
    void handle_tab_completion();
    std::string complete_command(const std::string& partial);
    void update_completion_hint();
    void show_help();

    WatchSession& session_;
    SessionStore& store_;
    RecentFiles& recent_;
    ActivityBuffer activity_;

    // Display state (UI thread only)
    std::array<bool, kSeverityCount> level_checked_;
    std::array<std::string, kSeverityCount> level_labels_;
    std::vector<StoredRecord> rows_;
    int selected_ = -1;
    bool follow_tail_ = true;
    std::string search_text_;
    StoreStats stats_;
    size_t display_limit_ = 2000;

    // Confirmation modal for /empty
    bool confirm_empty_ = false;

    // Command input state
    std::string command_input_;
    std::string completion_hint_;
    std::vector<SlashCommand> commands_;

    std::atomic<bool> rows_dirty_{true};
    std::atomic<bool> redraw_pending_{false};

    // Screen reference for refresh
    std::atomic<ftxui::ScreenInteractive*> screen_{nullptr};
};

} // namespace laralog
