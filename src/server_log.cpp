#include "server_log.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace logtap {

ServerLog::Sink ServerLog::sink_ = ServerLog::console_sink;
std::mutex ServerLog::mutex_;

void ServerLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : console_sink;
}

void ServerLog::reset_sink() {
    set_sink(nullptr);
}

void ServerLog::log(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(component, message, false);
    }
}

void ServerLog::error(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(component, message, true);
    }
}

void ServerLog::console_sink(const std::string& component,
                             const std::string& message, bool is_error) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);

    auto& out = is_error ? std::cerr : std::cout;
    out << std::put_time(&tm_buf, "%H:%M:%S") << " [" << component << "] " << message << std::endl;
}

} // namespace logtap
