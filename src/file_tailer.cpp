#include "file_tailer.hpp"
#include <algorithm>

namespace logtap {

namespace fs = std::filesystem;

namespace {
constexpr size_t kHeadBytes = 256;
}

FileTailer::FileTailer(const std::string& path, const std::string& source_name, TailerOptions options)
    : path_(path)
    , source_name_(source_name.empty() ? extract_filename(path) : source_name)
    , options_(options)
{
}

FileTailer::~FileTailer() {
    stop();
}

std::string FileTailer::extract_filename(const std::string& path) const {
    fs::path p(path);
    return p.filename().string();
}

void FileTailer::position_cursor() {
    positioned_ = true;

    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) {
        available_ = false;
        read_offset_ = 0;
        last_size_ = 0;
        return;
    }

    auto size = fs::file_size(path_, ec);
    if (ec) {
        ServerLog::error("FileTailer", "Failed to stat " + path_ + ": " + ec.message());
        available_ = false;
        return;
    }

    available_ = true;
    last_size_ = size;
    read_offset_ = options_.from_start ? 0 : static_cast<uint64_t>(size);

    if (read_offset_ > 0) {
        std::ifstream file(path_, std::ios::binary);
        if (file.is_open()) {
            capture_head(file);
        }
    }
}

void FileTailer::start() {
    if (running_) return;

    std::error_code ec;
    if (fs::exists(path_, ec) && !fs::is_regular_file(path_, ec)) {
        throw std::runtime_error(path_ + " is not a regular file");
    }

    if (!positioned_) {
        position_cursor();
    }

    running_ = true;

    ServerLog::log("FileTailer", "Started tailing: " + path_ + " (as " + source_name_ + ")" +
        (available_ ? "" : " [waiting for file]"));

    thread_ = std::thread([this]() {
        monitor_loop();
    });
}

void FileTailer::stop() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    ServerLog::log("FileTailer", "Stopped tailing: " + path_);
}

void FileTailer::monitor_loop() {
    while (running_) {
        try {
            poll();
        } catch (const std::exception& e) {
            ServerLog::error("FileTailer", std::string("Error reading ") + path_ + ": " + e.what());
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, options_.poll_interval, [this] { return !running_; });
    }
}

void FileTailer::mark_unavailable() {
    if (available_) {
        ServerLog::log("FileTailer", "Source unavailable, waiting for it to reappear: " + path_);
    }
    available_ = false;
    reset_cursor();
    last_size_ = 0;
}

void FileTailer::reset_cursor() {
    read_offset_ = 0;
    partial_.clear();
    head_.clear();
}

void FileTailer::capture_head(std::ifstream& file) {
    auto n = static_cast<size_t>(std::min<uint64_t>(kHeadBytes, read_offset_));
    std::string head(n, '\0');
    file.clear();
    file.seekg(0);
    file.read(&head[0], static_cast<std::streamsize>(n));
    head.resize(static_cast<size_t>(std::max<std::streamsize>(file.gcount(), 0)));
    head_ = std::move(head);
}

// A file truncated and rewritten past the old size between two ticks
// never shrinks as far as we can see; its first bytes differ instead.
bool FileTailer::head_changed(std::ifstream& file) {
    if (head_.empty()) return false;

    std::string current(head_.size(), '\0');
    file.clear();
    file.seekg(0);
    file.read(&current[0], static_cast<std::streamsize>(head_.size()));
    if (file.gcount() != static_cast<std::streamsize>(head_.size())) return true;
    return current != head_;
}

void FileTailer::poll() {
    if (!positioned_) {
        position_cursor();
    }

    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) {
        mark_unavailable();
        return;
    }

    auto current_size = fs::file_size(path_, ec);
    if (ec) {
        // Deleted between the two calls.
        mark_unavailable();
        return;
    }

    if (!available_) {
        ServerLog::log("FileTailer", "Source available: " + path_);
        available_ = true;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        ServerLog::error("FileTailer", "Failed to open " + path_);
        return;
    }

    // Shrinking means the file was truncated or replaced
    if (current_size < last_size_ || current_size < read_offset_) {
        ServerLog::log("FileTailer", "File truncated, resetting position: " + path_);
        reset_cursor();
    } else if (read_offset_ > 0 && head_changed(file)) {
        ServerLog::log("FileTailer", "File rewritten, resetting position: " + path_);
        reset_cursor();
    }
    last_size_ = current_size;

    uint64_t offset = read_offset_;
    if (current_size <= offset) {
        return;
    }

    auto to_read = static_cast<size_t>(std::min<uint64_t>(current_size - offset, options_.max_read_bytes));
    std::string chunk(to_read, '\0');

    file.clear();
    file.seekg(static_cast<std::streamoff>(offset));
    file.read(&chunk[0], static_cast<std::streamsize>(to_read));
    auto got = file.gcount();
    if (got <= 0) {
        return;
    }
    chunk.resize(static_cast<size_t>(got));

    read_offset_ = offset + static_cast<uint64_t>(got);
    if (head_.size() < kHeadBytes) {
        capture_head(file);
    }
    partial_.append(chunk);
    consume_lines();
}

void FileTailer::consume_lines() {
    size_t start = 0;
    size_t newline;
    while ((newline = partial_.find('\n', start)) != std::string::npos) {
        std::string line = partial_.substr(start, newline - start);
        start = newline + 1;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        dispatch_line(line);
    }
    partial_.erase(0, start);

    if (partial_.size() > options_.max_line_bytes) {
        ++malformed_;
        ServerLog::error("FileTailer", source_name_ + ": discarding " + std::to_string(partial_.size()) +
            " bytes without a line terminator");
        partial_.clear();
    }
}

void FileTailer::dispatch_line(const std::string& line) {
    std::string error;
    auto record = LogRecord::parse_line(line, source_name_, &error);
    if (!record) {
        ++malformed_;
        ServerLog::error("FileTailer", source_name_ + ": skipping malformed line (" + error + ")");
        return;
    }
    ++lines_;

    auto shared = std::make_shared<const LogRecord>(std::move(*record));

    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (auto& listener : listeners_) {
        listener->offer(shared);
    }
}

void FileTailer::attach(std::shared_ptr<Multiplexer> listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

void FileTailer::detach(uint64_t listener_id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
            [listener_id](const auto& l) { return l->id() == listener_id; }),
        listeners_.end()
    );
}

size_t FileTailer::listener_count() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.size();
}

TailerStatus FileTailer::status() const {
    TailerStatus s;
    s.name = source_name_;
    s.path = path_;
    s.running = running_;
    s.available = available_;
    s.offset = read_offset_;
    s.lines = lines_;
    s.malformed = malformed_;
    s.listeners = listener_count();
    return s;
}

} // namespace logtap
