#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace logtap {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    std::string host = "127.0.0.1";
    uint16_t port = 5050;
    std::string log_dir = "./logs";
    std::chrono::milliseconds poll_interval{250};
    size_t queue_size = 1000;
    std::chrono::seconds keepalive{15};
    size_t http_threads = 32;
    bool from_start = false;

    bool tui = false;
    std::vector<std::string> tui_files;
    std::string tui_filter;

    bool show_help = false;
};

// Throws ConfigError on unknown flags, missing values and out-of-range numbers.
Config parse_args(int argc, const char* const argv[]);

std::string usage(const std::string& program);

std::vector<std::string> split_list(const std::string& value);

} // namespace logtap
