#pragma once

#include "config.hpp"
#include "log_record.hpp"
#include "source_registry.hpp"
#include "stream_broadcaster.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace logtap {

class ConsoleUI;

struct SlashCommand {
    std::string name;
    std::string description;
    std::function<void(ConsoleUI&, const std::vector<std::string>&)> handler;
};

struct DisplayRecordLine {
    std::string source;
    std::string text;
    Severity severity = Severity::Unknown;
};

struct ServerLogLine {
    std::string component;
    std::string message;
    bool is_error = false;
};

// Thread-safe ring of the most recent display lines.
template<typename T>
class LogBuffer {
public:
    explicit LogBuffer(size_t max_lines = 1000);
    void push(T line);
    std::vector<T> get_lines() const;
    size_t size() const;
    void clear();
private:
    mutable std::mutex mutex_;
    std::deque<T> lines_;
    size_t max_lines_;
};

struct DisplayStats {
    uint64_t received = 0;
    uint64_t dropped = 0;
    double records_per_second = 0.0;
    size_t streams = 0;
    size_t sources = 0;
};

// Terminal viewer. Reads the same merged stream an HTTP viewer would,
// through its own subscription.
class ConsoleUI {
public:
    ConsoleUI(StreamBroadcaster& broadcaster, SourceRegistry& registry, const Config& config);
    ~ConsoleUI();

    // Blocks until the user quits or `running` turns false.
    void run(std::atomic<bool>& running);

    // Replaces the viewer subscription. On failure the current one is kept
    // and the error is shown in the server log pane.
    bool resubscribe(const std::vector<std::string>& files, const std::string& filter);

    void log_server(const std::string& component, const std::string& message,
                    bool is_error = false);

    using ServerLogSink = std::function<void(const std::string&, const std::string&, bool)>;
    ServerLogSink get_log_sink();

    static std::string format_record(const LogRecord& record);

private:
    ftxui::Color severity_to_color(Severity s);
    void consume_loop();
    void on_record(const LogRecord& record);
    void update_stats();
    void refresh();
    std::string selection_label() const;

    void init_commands(std::atomic<bool>& running, ftxui::ScreenInteractive& screen);
    void execute_command();
    std::vector<std::string> matching_commands(const std::string& prefix) const;
    void handle_tab_completion();
    void update_completion_hint();

    StreamBroadcaster& broadcaster_;
    SourceRegistry& registry_;
    Config config_;

    mutable std::mutex subscription_mutex_;
    std::shared_ptr<Subscription> subscription_;
    std::vector<std::string> files_;
    std::string filter_;

    std::atomic<bool> consuming_{false};
    std::thread consumer_;

    LogBuffer<DisplayRecordLine> records_;
    LogBuffer<ServerLogLine> server_logs_;
    DisplayStats stats_;
    std::mutex stats_mutex_;

    std::atomic<bool> paused_{false};
    std::atomic<uint64_t> received_{0};
    std::atomic<int64_t> records_in_window_{0};
    std::chrono::steady_clock::time_point rate_window_start_;

    std::string command_input_;
    std::string completion_hint_;
    std::vector<SlashCommand> commands_;

    std::atomic<ftxui::ScreenInteractive*> screen_{nullptr};
};

} // namespace logtap
