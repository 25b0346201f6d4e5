#pragma once

#include "log_record.hpp"
#include "multiplexer.hpp"
#include "server_log.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace logtap {

struct TailerOptions {
    std::chrono::milliseconds poll_interval{250};
    bool from_start = false;                  // read existing content instead of starting at EOF
    size_t max_read_bytes = 1 << 20;          // per poll tick
    size_t max_line_bytes = 1 << 20;          // longer unterminated lines are discarded
};

struct TailerStatus {
    std::string name;
    std::string path;
    bool running = false;
    bool available = false;
    uint64_t offset = 0;
    uint64_t lines = 0;
    uint64_t malformed = 0;
    size_t listeners = 0;

    nlohmann::json to_json() const {
        return {
            {"name", name},
            {"path", path},
            {"running", running},
            {"available", available},
            {"offset", offset},
            {"lines", lines},
            {"malformed", malformed},
            {"listeners", listeners}
        };
    }
};

class FileTailer {
public:
    FileTailer(const std::string& path, const std::string& source_name = "",
               TailerOptions options = {});
    ~FileTailer();

    FileTailer(const FileTailer&) = delete;
    FileTailer& operator=(const FileTailer&) = delete;

    // Positions the cursor and starts the polling thread. A missing file
    // is not an error: it is read from the beginning once it appears.
    // Throws std::runtime_error if the path exists but is not a regular file.
    void start();
    void stop();
    bool is_running() const { return running_; }

    // One poll tick. Called by the polling thread; tests call it directly
    // on a tailer that has not been started.
    void poll();

    void attach(std::shared_ptr<Multiplexer> listener);
    void detach(uint64_t listener_id);
    size_t listener_count() const;

    const std::string& path() const { return path_; }
    const std::string& source_name() const { return source_name_; }
    bool available() const { return available_; }
    uint64_t offset() const { return read_offset_; }
    uint64_t malformed_lines() const { return malformed_; }
    TailerStatus status() const;

private:
    void monitor_loop();
    void position_cursor();
    void mark_unavailable();
    void reset_cursor();
    void capture_head(std::ifstream& file);
    bool head_changed(std::ifstream& file);
    void consume_lines();
    void dispatch_line(const std::string& line);
    std::string extract_filename(const std::string& path) const;

    std::string path_;
    std::string source_name_;
    TailerOptions options_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    // Cursor state, written only by the polling activity.
    std::atomic<uint64_t> read_offset_{0};
    std::uintmax_t last_size_{0};
    std::string partial_;
    std::string head_;      // first bytes already read; detects in-place rewrites
    std::atomic<bool> available_{false};
    bool positioned_{false};

    std::atomic<uint64_t> lines_{0};
    std::atomic<uint64_t> malformed_{0};

    mutable std::mutex listeners_mutex_;
    std::vector<std::shared_ptr<Multiplexer>> listeners_;
};

} // namespace logtap
