#include "console_ui.hpp"
#include "server_log.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <algorithm>
#include <sstream>

namespace logtap {

template<typename T>
LogBuffer<T>::LogBuffer(size_t max_lines) : max_lines_(max_lines) {}

template<typename T>
void LogBuffer<T>::push(T line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
    while (lines_.size() > max_lines_) {
        lines_.pop_front();
    }
}

template<typename T>
std::vector<T> LogBuffer<T>::get_lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<T>(lines_.begin(), lines_.end());
}

template<typename T>
size_t LogBuffer<T>::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

template<typename T>
void LogBuffer<T>::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

template class LogBuffer<DisplayRecordLine>;
template class LogBuffer<ServerLogLine>;

ConsoleUI::ConsoleUI(StreamBroadcaster& broadcaster, SourceRegistry& registry, const Config& config)
    : broadcaster_(broadcaster)
    , registry_(registry)
    , config_(config)
    , records_(2000)
    , server_logs_(500)
    , rate_window_start_(std::chrono::steady_clock::now())
{
}

ConsoleUI::~ConsoleUI() {
    consuming_ = false;
    if (consumer_.joinable()) {
        consumer_.join();
    }
    std::lock_guard<std::mutex> lock(subscription_mutex_);
    if (subscription_) {
        subscription_->close();
        subscription_.reset();
    }
}

std::string ConsoleUI::format_record(const LogRecord& record) {
    std::ostringstream out;
    out << record.ts();
    if (!record.level().empty()) out << " " << record.level();
    if (!record.component().empty()) out << " " << record.component();
    if (!record.event().empty()) out << " " << record.event();

    const auto& data = record.data();
    if (!(data.is_object() && data.empty())) {
        out << " " << data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return out.str();
}

bool ConsoleUI::resubscribe(const std::vector<std::string>& files, const std::string& filter) {
    std::shared_ptr<Subscription> next;
    try {
        next = broadcaster_.subscribe(files, filter);
    } catch (const std::exception& e) {
        log_server("Viewer", e.what(), true);
        return false;
    }

    std::shared_ptr<Subscription> previous;
    {
        std::lock_guard<std::mutex> lock(subscription_mutex_);
        previous = std::move(subscription_);
        subscription_ = next;
        files_ = files;
        filter_ = filter;
    }
    if (previous) {
        previous->close();
    }

    log_server("Viewer", "Following " + selection_label());
    return true;
}

std::string ConsoleUI::selection_label() const {
    std::lock_guard<std::mutex> lock(subscription_mutex_);
    if (!subscription_) return "nothing";

    std::string label;
    for (const auto& name : subscription_->sources()) {
        if (!label.empty()) label += ",";
        label += name;
    }
    if (!subscription_->filter().empty()) {
        label += " where " + subscription_->filter().to_string();
    }
    return label;
}

void ConsoleUI::consume_loop() {
    while (consuming_) {
        std::shared_ptr<Subscription> current;
        {
            std::lock_guard<std::mutex> lock(subscription_mutex_);
            current = subscription_;
        }

        if (!current || current->is_closed()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            continue;
        }

        auto record = current->multiplexer().next(std::chrono::milliseconds(200));
        if (record) {
            on_record(**record);
        }
    }
}

void ConsoleUI::on_record(const LogRecord& record) {
    ++received_;
    ++records_in_window_;
    if (paused_) return;

    DisplayRecordLine line;
    line.source = record.source();
    line.text = format_record(record);
    line.severity = record.severity();
    records_.push(std::move(line));

    refresh();
}

void ConsoleUI::refresh() {
    if (auto* screen = screen_.load()) {
        screen->Post(ftxui::Event::Custom);
    }
}

void ConsoleUI::log_server(const std::string& component,
                           const std::string& message, bool is_error) {
    ServerLogLine line;
    line.component = component;
    line.message = message;
    line.is_error = is_error;

    server_logs_.push(std::move(line));
    refresh();
}

ConsoleUI::ServerLogSink ConsoleUI::get_log_sink() {
    return [this](const std::string& component, const std::string& msg, bool err) {
        this->log_server(component, msg, err);
    };
}

ftxui::Color ConsoleUI::severity_to_color(Severity s) {
    using namespace ftxui;
    switch (s) {
        case Severity::Error:
            return Color::Red;
        case Severity::Warning:
            return Color::Yellow;
        case Severity::Debug:
            return Color::GrayDark;
        default:
            return Color::White;
    }
}

void ConsoleUI::update_stats() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration<double>(now - rate_window_start_).count();
    if (elapsed < 1.0) return;

    double rate = static_cast<double>(records_in_window_.exchange(0)) / elapsed;
    rate_window_start_ = now;

    auto streams = broadcaster_.stats();

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.received = received_;
    stats_.dropped = streams.dropped;
    stats_.records_per_second = rate;
    stats_.streams = streams.active;
    stats_.sources = registry_.active_count();
}

void ConsoleUI::init_commands(std::atomic<bool>& running, ftxui::ScreenInteractive& screen) {
    auto quit = [&running, &screen](ConsoleUI&, const std::vector<std::string>&) {
        running = false;
        screen.Exit();
    };
    auto pause = [](ConsoleUI& ui, const std::vector<std::string>&) {
        ui.paused_ = !ui.paused_;
    };
    auto help = [](ConsoleUI& ui, const std::vector<std::string>&) {
        ui.log_server("Help", "Available commands:");
        for (const auto& cmd : ui.commands_) {
            ui.log_server("Help", "  /" + cmd.name + " - " + cmd.description);
        }
    };

    commands_ = {
        {"quit", "Exit the application", quit},
        {"q", "Exit (alias for quit)", quit},
        {"pause", "Toggle record display", pause},
        {"p", "Toggle pause (alias)", pause},
        {"clear", "Clear the record pane", [](ConsoleUI& ui, const std::vector<std::string>&) {
            ui.records_.clear();
        }},
        {"filter", "Set filter: /filter key=value,... (no args clears)", [](ConsoleUI& ui, const std::vector<std::string>& args) {
            std::string expr;
            for (const auto& a : args) {
                if (!expr.empty()) expr += " ";
                expr += a;
            }
            std::vector<std::string> files;
            {
                std::lock_guard<std::mutex> lock(ui.subscription_mutex_);
                files = ui.files_;
            }
            ui.resubscribe(files, expr);
        }},
        {"files", "Follow files: /files a.jsonl,b.jsonl (no args follows all)", [](ConsoleUI& ui, const std::vector<std::string>& args) {
            std::vector<std::string> files;
            for (const auto& a : args) {
                auto parts = split_list(a);
                files.insert(files.end(), parts.begin(), parts.end());
            }
            std::string filter;
            {
                std::lock_guard<std::mutex> lock(ui.subscription_mutex_);
                filter = ui.filter_;
            }
            ui.resubscribe(files, filter);
        }},
        {"sources", "List watched files", [](ConsoleUI& ui, const std::vector<std::string>&) {
            auto files = ui.registry_.list_files();
            ui.log_server("Sources", std::to_string(files.size()) + " file(s) in " + ui.registry_.log_dir().string());
            for (const auto& info : ui.registry_.list_sources()) {
                ui.log_server("Sources", "  " + info.name + " offset=" + std::to_string(info.tailer.offset) +
                    " subscribers=" + std::to_string(info.subscribers) +
                    " malformed=" + std::to_string(info.tailer.malformed) +
                    (info.tailer.available ? "" : " [missing]"));
            }
        }},
        {"help", "Show available commands", help},
        {"h", "Help (alias)", help},
    };
}

void ConsoleUI::execute_command() {
    std::string input = command_input_;
    command_input_.clear();
    completion_hint_.clear();

    if (!input.empty() && input[0] == '/') {
        input = input.substr(1);
    }
    if (input.empty()) return;

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

    log_server("Command", "Unknown command: /" + cmd + " (type /help for available commands)", true);
}

std::vector<std::string> ConsoleUI::matching_commands(const std::string& prefix) const {
    std::vector<std::string> matches;
    for (const auto& cmd : commands_) {
        if (cmd.name.compare(0, prefix.size(), prefix) == 0) {
            matches.push_back(cmd.name);
        }
    }
    return matches;
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

    std::string prefix = command_input_.substr(1);
    if (prefix.find(' ') != std::string::npos) {
        completion_hint_.clear();
        return;
    }

    auto matches = matching_commands(prefix);
    if (matches.empty()) {
        completion_hint_ = "(no match)";
    } else if (std::find(matches.begin(), matches.end(), prefix) != matches.end()) {
        completion_hint_.clear();
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
    } else if (command_input_[0] == '/' && command_input_.find(' ') == std::string::npos) {
        std::string prefix = command_input_.substr(1);
        auto matches = matching_commands(prefix);
        if (!matches.empty()) {
            // Extend to the longest common prefix of the candidates
            std::string common = matches[0];
            for (const auto& m : matches) {
                size_t j = 0;
                while (j < common.size() && j < m.size() && common[j] == m[j]) ++j;
                common.resize(j);
            }
            if (common.size() > prefix.size()) {
                command_input_ = "/" + common;
            }
        }
    }
    update_completion_hint();
}

void ConsoleUI::run(std::atomic<bool>& running) {
    using namespace ftxui;

    auto screen = ScreenInteractive::Fullscreen();
    screen_ = &screen;

    init_commands(running, screen);
    update_completion_hint();

    resubscribe(config_.tui_files, config_.tui_filter);

    consuming_ = true;
    consumer_ = std::thread([this]() { consume_loop(); });

    std::atomic<bool> stats_running{true};
    std::thread stats_thread([this, &stats_running, &running, &screen]() {
        while (stats_running) {
            update_stats();
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            if (!running) {
                // Shutdown requested from outside the UI (signal)
                screen.Exit();
                break;
            }
            refresh();
        }
    });

    auto input_option = InputOption::Default();
    input_option.transform = [](InputState state) {
        state.element |= color(Color::White);
        return state.element;
    };
    auto input_component = Input(&command_input_, "", input_option);

    auto command_handler = CatchEvent(input_component, [this](Event event) {
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
            update_completion_hint();
            return true;
        }
        return false;
    });

    auto command_with_hints = CatchEvent(command_handler, [this](Event event) {
        if (event.is_character() || event == Event::Backspace || event == Event::Delete) {
            update_completion_hint();
        }
        return false;
    });

    auto main_content = Renderer([this]() {
        DisplayStats current;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            current = stats_;
        }

        auto app_info = vbox({
            hbox({
                text(" logtap") | bold | color(Color::White),
                text(" live JSON-lines viewer") | dim,
            }),
            text(" " + registry_.log_dir().string()) | dim,
            text(" following: " + selection_label()) | dim,
        });

        auto stats_box = vbox({
            hbox({
                text("records ") | dim,
                text(std::to_string(current.received)),
                text("  dropped ") | dim,
                text(std::to_string(current.dropped)) | color(current.dropped ? Color::Yellow : Color::White),
                text("  rate ") | dim,
                text(std::to_string(static_cast<int>(current.records_per_second)) + "/s"),
            }),
            hbox({
                text("http " + config_.host + ":" + std::to_string(config_.port)) | dim,
                text("  streams ") | dim,
                text(std::to_string(current.streams)),
                text("  files ") | dim,
                text(std::to_string(current.sources)),
            }),
        });

        auto top_bar = hbox({
            app_info,
            filler(),
            stats_box,
            text(" "),
        });

        auto record_lines = records_.get_lines();
        Elements record_elements;
        size_t start_idx = record_lines.size() > 200 ? record_lines.size() - 200 : 0;
        for (size_t i = start_idx; i < record_lines.size(); ++i) {
            const auto& line = record_lines[i];
            record_elements.push_back(hbox({
                text("[" + line.source + "] ") | dim,
                text(line.text) | color(severity_to_color(line.severity)),
            }));
        }

        auto record_pane = vbox({
            hbox({
                text(" Records ") | bold,
                filler(),
                text("(" + std::to_string(records_.size()) + ")") | dim,
            }),
            separator() | color(Color::GrayDark),
            vbox(std::move(record_elements)) | focusPositionRelative(0, 1) | vscroll_indicator | yframe | flex,
        }) | flex | border | color(Color::GrayDark);

        auto server_lines = server_logs_.get_lines();
        Elements server_elements;
        size_t srv_start = server_lines.size() > 100 ? server_lines.size() - 100 : 0;
        for (size_t i = srv_start; i < server_lines.size(); ++i) {
            const auto& line = server_lines[i];
            auto elem = paragraph("[" + line.component + "] " + line.message) |
                (line.is_error ? color(Color::Red) : nothing);
            server_elements.push_back(elem);
        }

        auto server_pane = vbox({
            hbox({
                text(" Server ") | bold,
                filler(),
                text("(" + std::to_string(server_logs_.size()) + ")") | dim,
            }),
            separator() | color(Color::GrayDark),
            vbox(std::move(server_elements)) | focusPositionRelative(0, 1) | vscroll_indicator | yframe | flex,
        }) | flex | border | color(Color::GrayDark);

        return vbox({
            top_bar,
            hbox({
                record_pane | flex,
                server_pane | size(WIDTH, EQUAL, 48),
            }) | flex,
        });
    });

    auto cmd_bar = Renderer(command_with_hints, [this, &input_component]() {
        return hbox({
            text(" > ") | bold | color(Color::GrayLight),
            input_component->Render() | size(WIDTH, GREATER_THAN, 20),
            filler(),
            paused_ ? (text(" PAUSED ") | bgcolor(Color::Yellow) | color(Color::Black)) : text(""),
            text(completion_hint_) | dim | color(Color::GrayDark),
            text(" "),
        });
    });

    auto main_layout = Renderer(command_with_hints, [&main_content, &cmd_bar]() {
        return vbox({
            main_content->Render() | flex,
            separator() | color(Color::GrayDark),
            cmd_bar->Render() | size(HEIGHT, EQUAL, 1),
        });
    });

    screen.Loop(main_layout);

    stats_running = false;
    stats_thread.join();
    screen_ = nullptr;

    consuming_ = false;
    if (consumer_.joinable()) {
        consumer_.join();
    }
}

} // namespace logtap
