#include "console_ui.hpp"
#include "app_log.hpp"
#include "entry_parser.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <ftxui/screen/terminal.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace laralog {

// ActivityBuffer implementation
ActivityBuffer::ActivityBuffer(size_t max_lines) : max_lines_(max_lines) {}

void ActivityBuffer::push(ActivityLine line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
    while (lines_.size() > max_lines_) {
        lines_.pop_front();
    }
}

std::vector<ActivityLine> ActivityBuffer::get_lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ActivityLine>(lines_.begin(), lines_.end());
}

size_t ActivityBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

void ActivityBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

namespace {

std::string upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string capitalize(const std::string& s) {
    if (s.empty()) return s;
    std::string out = s;
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

ConsoleUI::ConsoleUI(WatchSession& session, SessionStore& store, RecentFiles& recent)
    : session_(session)
    , store_(store)
    , recent_(recent)
    , activity_(500)
{
    for (Severity s : kAllSeverities) {
        level_checked_[static_cast<size_t>(s)] = session_.severity_enabled(s);
    }

    session_.queue().set_notify([this]() {
        request_redraw();
    });
}

ConsoleUI::~ConsoleUI() {
    session_.queue().set_notify(nullptr);
}

void ConsoleUI::request_redraw() {
    ftxui::ScreenInteractive* screen = screen_;
    if (screen && !redraw_pending_.exchange(true)) {
        screen->Post(ftxui::Event::Custom);
    }
}

void ConsoleUI::log_activity(const std::string& component,
                             const std::string& message, bool is_error) {
    ActivityLine line;
    line.component = component;
    line.message = message;
    line.is_error = is_error;
    line.timestamp = std::chrono::steady_clock::now();

    activity_.push(std::move(line));
    request_redraw();
}

ConsoleUI::ActivitySink ConsoleUI::get_log_sink() {
    return [this](const std::string& component, const std::string& msg, bool err) {
        this->log_activity(component, msg, err);
    };
}

void ConsoleUI::on_watch_event(const WatchEvent& event) {
    if (event.kind == WatchEventKind::FileNotFound) {
        log_activity("Watch", "Watching stopped: " + event.path + " no longer exists", true);
    }
    rows_dirty_ = true;
    request_redraw();
}

ftxui::Color ConsoleUI::severity_to_color(Severity s) {
    using namespace ftxui;
    switch (s) {
        case Severity::Emergency:
        case Severity::Alert:
        case Severity::Critical:
            return Color::RedLight;
        case Severity::Error:
            return Color::Red;
        case Severity::Warning:
            return Color::Yellow;
        case Severity::Notice:
            return Color::Cyan;
        case Severity::Info:
            return Color::White;
        case Severity::Debug:
            return Color::GrayDark;
        default:
            return Color::Magenta;
    }
}

std::string ConsoleUI::format_row_time(const LogRecord& record) {
    if (record.timestamp_text.empty()) return "-";
    return record.timestamp_text;
}

bool ConsoleUI::ingest_pending() {
    auto records = session_.queue().drain();
    if (records.empty()) return false;

    for (const auto& record : records) {
        try {
            store_.insert(*record);
        } catch (const std::exception& e) {
            AppLog::error("Store", e.what());
        }
    }
    return true;
}

void ConsoleUI::refresh_rows() {
    int64_t selected_id = (selected_ >= 0 && selected_ < static_cast<int>(rows_.size()))
        ? rows_[static_cast<size_t>(selected_)].id : -1;

    StoreFilter filter;
    filter.severities = level_checked_;
    filter.newest_first = true;
    filter.limit = static_cast<int>(display_limit_);
    if (!search_text_.empty()) {
        filter.text = search_text_;
    }

    try {
        rows_ = store_.query(filter);
        std::reverse(rows_.begin(), rows_.end());
        stats_ = store_.stats();
    } catch (const std::exception& e) {
        AppLog::error("Store", e.what());
        rows_.clear();
    }

    if (rows_.empty()) {
        selected_ = -1;
        return;
    }
    if (follow_tail_ || selected_id < 0) {
        selected_ = static_cast<int>(rows_.size()) - 1;
        return;
    }
    auto it = std::find_if(rows_.begin(), rows_.end(),
                           [selected_id](const StoredRecord& r) { return r.id == selected_id; });
    selected_ = it == rows_.end() ? static_cast<int>(rows_.size()) - 1
                                  : static_cast<int>(it - rows_.begin());
}

void ConsoleUI::move_selection(int delta) {
    if (rows_.empty()) return;
    int last = static_cast<int>(rows_.size()) - 1;
    selected_ = std::clamp(selected_ + delta, 0, last);
    follow_tail_ = selected_ == last;
}

void ConsoleUI::clear_display() {
    // Display only: the watcher keeps its position in the file.
    session_.queue().clear();
    try {
        store_.clear();
    } catch (const std::exception& e) {
        AppLog::error("Store", e.what());
    }
    rows_.clear();
    selected_ = -1;
    follow_tail_ = true;
    rows_dirty_ = true;
}

void ConsoleUI::open_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        log_activity("Open", "File not found: " + path, true);
        if (!recent_.remove(path)) {
            log_activity("Open", "Could not update " + recent_.config_path(), true);
        }
        return;
    }

    bool was_watching = session_.is_watching();
    if (was_watching && session_.current_file() != path) {
        clear_display();
    }
    if (!session_.set_current_file(path)) {
        log_activity("Open", "Failed to open " + path, true);
        return;
    }
    if (!was_watching && !session_.start_watching(path)) {
        log_activity("Open", "Failed to start watching " + path, true);
    }
}

void ConsoleUI::toggle_watching() {
    if (session_.is_watching()) {
        session_.stop_watching();
    } else if (!session_.start_watching()) {
        log_activity("Watch", "Nothing to watch. Use /open <path> first", true);
    }
}

void ConsoleUI::request_empty_log() {
    if (session_.current_file().empty()) {
        log_activity("Empty", "No log file selected!", true);
        return;
    }
    confirm_empty_ = true;
}

void ConsoleUI::confirm_empty_log() {
    confirm_empty_ = false;
    try {
        session_.empty_log_file();
        clear_display();
        log_activity("Empty", "Log file has been emptied", false);
    } catch (const std::exception& e) {
        log_activity("Empty", e.what(), true);
    }
}

void ConsoleUI::show_help() {
    log_activity("Help", "Available commands:", false);
    for (const auto& cmd : commands_) {
        if (cmd.name.size() <= 1) continue;  // aliases
        log_activity("Help", "  /" + cmd.name + " - " + cmd.description, false);
    }
    log_activity("Help", "  F1..F8 toggle levels, Up/Down/PgUp/PgDn select", false);
}

void ConsoleUI::init_commands(std::atomic<bool>& running, ftxui::ScreenInteractive& screen) {
    auto quit = [&running, &screen](ConsoleUI&, const std::vector<std::string>&) {
        running = false;
        screen.Exit();
    };

    commands_ = {
        {"quit", "Exit the application", quit, false},
        {"q", "Exit (alias for quit)", quit, false},
        {"open", "Watch a file: /open <path>", [](ConsoleUI& ui, const std::vector<std::string>& args) {
            if (args.empty()) {
                ui.log_activity("Open", "Usage: /open <path>", true);
                return;
            }
            std::string path = args[0];
            for (size_t i = 1; i < args.size(); ++i) path += " " + args[i];
            ui.open_file(path);
        }, true},
        {"recent", "List recent files, /recent <n> opens one", [](ConsoleUI& ui, const std::vector<std::string>& args) {
            const auto& files = ui.recent_.files();
            if (args.empty()) {
                if (files.empty()) {
                    ui.log_activity("Recent", "No recent files", false);
                    return;
                }
                for (size_t i = 0; i < files.size(); ++i) {
                    ui.log_activity("Recent", "  " + std::to_string(i + 1) + ": " + files[i], false);
                }
                return;
            }
            size_t n = 0;
            try {
                n = static_cast<size_t>(std::stoul(args[0]));
            } catch (const std::exception&) {
                ui.log_activity("Recent", "Not a number: " + args[0], true);
                return;
            }
            if (n == 0 || n > files.size()) {
                ui.log_activity("Recent", "No recent file #" + args[0], true);
                return;
            }
            std::string path = files[n - 1];
            ui.open_file(path);
        }, true},
        {"watch", "Start watching the current file", [](ConsoleUI& ui, const std::vector<std::string>&) {
            if (!ui.session_.is_watching()) ui.toggle_watching();
        }, false},
        {"stop", "Stop watching", [](ConsoleUI& ui, const std::vector<std::string>&) {
            ui.session_.stop_watching();
        }, false},
        {"clear", "Clear the display", [](ConsoleUI& ui, const std::vector<std::string>&) {
            ui.clear_display();
        }, false},
        {"empty", "Empty the log file (asks first)", [](ConsoleUI& ui, const std::vector<std::string>&) {
            ui.request_empty_log();
        }, false},
        {"search", "Filter by text: /search <text>, no text resets", [](ConsoleUI& ui, const std::vector<std::string>& args) {
            std::string text;
            for (size_t i = 0; i < args.size(); ++i) {
                if (i > 0) text += " ";
                text += args[i];
            }
            ui.search_text_ = text;
            ui.rows_dirty_ = true;
        }, true},
        {"level", "Toggle a level: /level <name> on|off", [](ConsoleUI& ui, const std::vector<std::string>& args) {
            if (args.size() != 2 || (args[1] != "on" && args[1] != "off")) {
                ui.log_activity("Level", "Usage: /level <name> on|off", true);
                return;
            }
            Severity s = severity_from_string(args[0]);
            if (s == Severity::Unknown) {
                ui.log_activity("Level", "Unknown level: " + args[0], true);
                return;
            }
            bool on = args[1] == "on";
            ui.level_checked_[static_cast<size_t>(s)] = on;
            ui.session_.set_severity_enabled(s, on);
            ui.rows_dirty_ = true;
        }, true},
        {"help", "Show available commands", [](ConsoleUI& ui, const std::vector<std::string>&) {
            ui.show_help();
        }, false},
        {"h", "Help (alias)", [](ConsoleUI& ui, const std::vector<std::string>&) {
            ui.show_help();
        }, false},
    };
}

void ConsoleUI::execute_command() {
    if (command_input_.empty()) return;

    std::string input = command_input_;
    command_input_.clear();
    completion_hint_.clear();

    // Remove leading / if present
    if (!input.empty() && input[0] == '/') {
        input = input.substr(1);
    }

    if (input.empty()) return;

    // Parse command and arguments
    std::istringstream iss(input);
    std::string cmd;
    iss >> cmd;

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) {
        args.push_back(arg);
    }

    for (const auto& command : commands_) {
        if (command.name == cmd) {
            command.handler(*this, args);
            return;
        }
    }

    log_activity("Command", "Unknown command: /" + cmd + " (type /help for available commands)", true);
}

std::string ConsoleUI::complete_command(const std::string& partial) {
    if (partial.empty() || partial[0] != '/') return partial;

    std::string prefix = partial.substr(1);
    std::vector<std::string> matches;

    for (const auto& cmd : commands_) {
        if (cmd.name.find(prefix) == 0) {
            matches.push_back(cmd.name);
        }
    }

    if (matches.size() == 1) {
        return "/" + matches[0];
    } else if (matches.size() > 1 && !prefix.empty()) {
        // Longest common prefix
        std::string common = matches[0];
        for (size_t i = 1; i < matches.size(); ++i) {
            size_t j = 0;
            while (j < common.size() && j < matches[i].size() &&
                   common[j] == matches[i][j]) {
                ++j;
            }
            common = common.substr(0, j);
        }
        if (common.size() > prefix.size()) {
            return "/" + common;
        }
    }
    return partial;
}

void ConsoleUI::update_completion_hint() {
    if (command_input_.empty()) {
        completion_hint_ = "Type /help for commands";
        return;
    }

    if (command_input_[0] != '/') {
        completion_hint_ = "Commands start with /";
        return;
    }

    if (command_input_.size() == 1) {
        completion_hint_ = "open, recent, watch, stop, clear, empty, search, level, quit";
        return;
    }

    std::string prefix = command_input_.substr(1);
    std::string::size_type space = prefix.find(' ');
    if (space != std::string::npos) {
        completion_hint_ = "";
        return;
    }

    std::vector<std::string> matches;
    for (const auto& cmd : commands_) {
        if (cmd.name == prefix) {
            completion_hint_ = cmd.description;
            return;
        }
        if (cmd.name.find(prefix) == 0) {
            matches.push_back(cmd.name);
        }
    }

    if (matches.empty()) {
        completion_hint_ = "(no match)";
    } else {
        std::string hint = "Tab: ";
        for (size_t i = 0; i < matches.size(); ++i) {
            if (i > 0) hint += ", ";
            hint += matches[i];
        }
        completion_hint_ = hint;
    }
}

void ConsoleUI::handle_tab_completion() {
    if (command_input_.empty()) {
        command_input_ = "/";
        update_completion_hint();
        return;
    }

    command_input_ = complete_command(command_input_);
    update_completion_hint();
}

void ConsoleUI::run(std::atomic<bool>& running) {
    using namespace ftxui;

    auto screen = ScreenInteractive::Fullscreen();
    screen_ = &screen;
    struct ScreenRelease {
        std::atomic<ftxui::ScreenInteractive*>& slot;
        ~ScreenRelease() { slot = nullptr; }
    } release{screen_};

    init_commands(running, screen);
    update_completion_hint();

    // Severity checkboxes
    Components level_boxes;
    for (Severity s : kAllSeverities) {
        auto option = CheckboxOption::Simple();
        option.on_change = [this, s]() {
            session_.set_severity_enabled(s, level_checked_[static_cast<size_t>(s)]);
            rows_dirty_ = true;
        };
        level_labels_[static_cast<size_t>(s)] = capitalize(severity_to_string(s));
        level_boxes.push_back(Checkbox(level_labels_[static_cast<size_t>(s)],
                                       &level_checked_[static_cast<size_t>(s)], option));
    }
    auto level_row = Container::Horizontal(level_boxes);

    // Command bar input
    auto input_option = InputOption::Default();
    input_option.multiline = false;
    input_option.transform = [](InputState state) {
        state.element |= color(Color::White);
        return state.element;
    };
    auto input_component = Input(&command_input_, "", input_option);

    auto command_input_handler = CatchEvent(input_component, [this](Event event) {
        if (event == Event::Tab) {
            handle_tab_completion();
            return true;
        }
        if (event == Event::Escape) {
            command_input_.clear();
            update_completion_hint();
            return true;
        }
        if (event == Event::Return) {
            execute_command();
            return true;
        }
        return false;
    });

    auto command_with_hints = CatchEvent(command_input_handler, [this](Event event) {
        if (event.is_character() || event == Event::Backspace || event == Event::Delete) {
            update_completion_hint();
        }
        return false;
    });

    auto controls = Container::Vertical({level_row, command_with_hints});

    auto main_layout = Renderer(controls, [this, &level_row, &input_component]() {
        redraw_pending_ = false;
        if (ingest_pending()) {
            rows_dirty_ = true;
        }
        if (rows_dirty_.exchange(false)) {
            refresh_rows();
        }

        // Header
        std::string file = session_.current_file();
        bool watching = session_.is_watching();
        auto state_badge = watching
            ? text(" WATCHING ") | bgcolor(Color::Green) | color(Color::Black)
            : text(" STOPPED ") | bgcolor(Color::GrayDark) | color(Color::White);

        Elements counts;
        for (Severity s : kAllSeverities) {
            int64_t n = stats_.count(s);
            if (n == 0) continue;
            counts.push_back(text(" " + upper(severity_to_string(s)).substr(0, 4) + ":" +
                                  std::to_string(n)) | color(severity_to_color(s)));
        }

        auto top_bar = hbox({
            text(" LaraLog ") | bold | color(Color::Cyan),
            state_badge,
            text(" "),
            text(file.empty() ? "No file selected" : std::filesystem::path(file).filename().string()) | bold,
            filler(),
            hbox(std::move(counts)),
            text("  total:" + std::to_string(stats_.total_count) + " ") | dim,
        });

        // Record table
        Elements table_rows;
        for (size_t i = 0; i < rows_.size(); ++i) {
            const LogRecord& r = *rows_[i].record;
            auto row = hbox({
                text(format_row_time(r)) | size(WIDTH, EQUAL, 21) | dim,
                text(" "),
                text(upper(severity_to_string(r.severity))) | size(WIDTH, EQUAL, 10) |
                    color(severity_to_color(r.severity)),
                text(r.summary) | flex,
            });
            if (static_cast<int>(i) == selected_) {
                row = row | inverted | focus;
            }
            table_rows.push_back(row);
        }

        auto table = vbox({
            hbox({
                text(" Time") | size(WIDTH, EQUAL, 22) | bold,
                text("Type") | size(WIDTH, EQUAL, 10) | bold,
                text("Message") | bold,
                filler(),
                text(search_text_.empty() ? "" : "search: \"" + search_text_ + "\" ") | color(Color::Yellow),
                text("(" + std::to_string(rows_.size()) + ")") | dim,
            }),
            separator() | color(Color::GrayDark),
            vbox(std::move(table_rows)) | vscroll_indicator | yframe | flex,
        }) | flex | border;

        // Details pane
        Elements detail_lines;
        if (selected_ >= 0 && selected_ < static_cast<int>(rows_.size())) {
            const LogRecord& r = *rows_[static_cast<size_t>(selected_)].record;
            detail_lines.push_back(hbox({
                text(r.timestamp_text.empty() ? "(no timestamp)" : r.timestamp_text) | dim,
                text(" "),
                text(r.channel.empty() ? "" : r.channel + ".") | dim,
                text(upper(severity_to_string(r.severity))) | color(severity_to_color(r.severity)),
                text("  " + payload_kind_to_string(r.payload_kind)) | dim,
            }));
            detail_lines.push_back(paragraph(r.summary) | bold);
            for (const auto& line : split_lines(format_details(r))) {
                detail_lines.push_back(text(line));
            }
        } else {
            detail_lines.push_back(text("No record selected") | dim);
        }
        auto details = vbox(std::move(detail_lines)) | yframe | flex;

        // Activity pane
        auto activity_lines = activity_.get_lines();
        Elements activity_elements;
        size_t start = activity_lines.size() > 100 ? activity_lines.size() - 100 : 0;
        for (size_t i = start; i < activity_lines.size(); ++i) {
            const auto& line = activity_lines[i];
            activity_elements.push_back(paragraph("[" + line.component + "] " + line.message) |
                                        (line.is_error ? color(Color::Red) : nothing));
        }
        auto activity = vbox({
            text(" Activity ") | bold,
            separator() | color(Color::GrayDark),
            vbox(std::move(activity_elements)) | focusPositionRelative(0, 1) | yframe | flex,
        }) | border | size(WIDTH, EQUAL, 40);

        auto bottom = hbox({
            window(text(" Details "), details) | flex,
            activity,
        }) | size(HEIGHT, EQUAL, 14);

        auto cmd_bar = hbox({
            text(" > ") | bold | color(Color::GrayLight),
            input_component->Render() | size(WIDTH, GREATER_THAN, 20) | flex,
            text(completion_hint_) | dim | color(Color::GrayDark),
            text(" "),
        });

        return vbox({
            top_bar,
            hbox({text(" Levels: ") | dim, level_row->Render()}),
            table,
            bottom,
            separator() | color(Color::GrayDark),
            cmd_bar | size(HEIGHT, EQUAL, 1),
        });
    });

    // Confirmation dialog for /empty
    auto yes_button = Button(" Yes ", [this]() { confirm_empty_log(); });
    auto no_button = Button(" No ", [this]() { confirm_empty_ = false; });
    auto dialog_buttons = Container::Horizontal({no_button, yes_button});
    auto dialog = Renderer(dialog_buttons, [this, &dialog_buttons]() {
        return vbox({
            text("Empty Log File") | bold | center,
            separator(),
            text("This will permanently delete all contents of:"),
            text(session_.current_file()) | color(Color::Yellow),
            separator(),
            dialog_buttons->Render() | center,
        }) | border | size(WIDTH, GREATER_THAN, 50);
    });
    auto with_modal = Modal(main_layout, dialog, &confirm_empty_);

    auto root = CatchEvent(with_modal, [this](Event event) {
        if (confirm_empty_) {
            if (event == Event::Escape) {
                confirm_empty_ = false;
                return true;
            }
            return false;
        }
        if (event == Event::ArrowUp) { move_selection(-1); return true; }
        if (event == Event::ArrowDown) { move_selection(1); return true; }
        if (event == Event::PageUp) { move_selection(-20); return true; }
        if (event == Event::PageDown) { move_selection(20); return true; }

        static const Event kLevelKeys[] = {
            Event::F1, Event::F2, Event::F3, Event::F4,
            Event::F5, Event::F6, Event::F7, Event::F8,
        };
        for (size_t i = 0; i < kSeverityCount; ++i) {
            if (event == kLevelKeys[i]) {
                level_checked_[i] = !level_checked_[i];
                session_.set_severity_enabled(kAllSeverities[i], level_checked_[i]);
                rows_dirty_ = true;
                return true;
            }
        }
        return false;
    });

    command_with_hints->TakeFocus();

    screen.Loop(root);

    // Quitting ends the watch; stop while the screen can still take posted redraws.
    session_.stop_watching();
}

} // namespace laralog
