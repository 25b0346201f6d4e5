#include "config.hpp"
#include <sstream>

namespace logtap {

namespace {

uint64_t parse_number(const std::string& flag, const std::string& value,
                      uint64_t min, uint64_t max) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError(flag + " expects a number, got '" + value + "'");
    }
    uint64_t n = 0;
    try {
        n = std::stoull(value);
    } catch (const std::exception&) {
        throw ConfigError(flag + " value out of range: " + value);
    }
    if (n < min || n > max) {
        throw ConfigError(flag + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return n;
}

} // namespace

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto begin = item.find_first_not_of(" \t");
        if (begin == std::string::npos) continue;
        auto end = item.find_last_not_of(" \t");
        items.push_back(item.substr(begin, end - begin + 1));
    }
    return items;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "logtap - live viewer for JSON-lines log files\n\n";
    out << "Usage: " << program << " [options]\n\n";
    out << "Options:\n";
    out << "  --host ADDR         Address to bind the HTTP server to (default: 127.0.0.1)\n";
    out << "  --port PORT         HTTP port (default: 5050)\n";
    out << "  --log-dir DIR       Directory holding the *.jsonl files (default: ./logs)\n";
    out << "  --poll-ms N         File poll interval in milliseconds (default: 250)\n";
    out << "  --queue-size N      Pending records kept per viewer (default: 1000)\n";
    out << "  --keepalive-sec N   Seconds between keep-alive comments (default: 15)\n";
    out << "  --http-threads N    HTTP worker threads, one per open stream (default: 32)\n";
    out << "  --from-start        Read existing file content when a file is first watched\n";
    out << "  --tui               Show a terminal viewer in addition to the HTTP server\n";
    out << "  --files a,b         Files the terminal viewer follows (default: all)\n";
    out << "  --filter EXPR       Initial terminal viewer filter, e.g. level=ERROR\n";
    out << "  --help              Show this help message\n\n";
    out << "Example:\n";
    out << "  " << program << " --log-dir ./logs --port 5050 --tui --filter component=mcp-server\n";
    return out.str();
}

Config parse_args(int argc, const char* const argv[]) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        }
        else if (arg == "--host") {
            config.host = value();
            if (config.host.empty()) throw ConfigError("--host must not be empty");
        }
        else if (arg == "--port") {
            config.port = static_cast<uint16_t>(parse_number(arg, value(), 1, 65535));
        }
        else if (arg == "--log-dir") {
            config.log_dir = value();
            if (config.log_dir.empty()) throw ConfigError("--log-dir must not be empty");
        }
        else if (arg == "--poll-ms") {
            config.poll_interval = std::chrono::milliseconds(parse_number(arg, value(), 10, 60000));
        }
        else if (arg == "--queue-size") {
            config.queue_size = static_cast<size_t>(parse_number(arg, value(), 1, 1000000));
        }
        else if (arg == "--keepalive-sec") {
            config.keepalive = std::chrono::seconds(parse_number(arg, value(), 1, 3600));
        }
        else if (arg == "--http-threads") {
            config.http_threads = static_cast<size_t>(parse_number(arg, value(), 2, 1024));
        }
        else if (arg == "--from-start") {
            config.from_start = true;
        }
        else if (arg == "--tui") {
            config.tui = true;
        }
        else if (arg == "--files") {
            config.tui_files = split_list(value());
        }
        else if (arg == "--filter") {
            config.tui_filter = value();
        }
        else {
            throw ConfigError("unknown option: " + arg);
        }
    }

    return config;
}

} // namespace logtap
