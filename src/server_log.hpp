#pragma once

#include <string>
#include <functional>
#include <mutex>

namespace logtap {

// Process-wide diagnostics sink. Defaults to stdout/stderr; the console
// viewer swaps in its own sink while it owns the terminal.
class ServerLog {
public:
    using Sink = std::function<void(const std::string& component,
                                     const std::string& message,
                                     bool is_error)>;

    static void set_sink(Sink sink);
    static void reset_sink();
    static void log(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    static void console_sink(const std::string& component,
                             const std::string& message, bool is_error);

private:
    static Sink sink_;
    static std::mutex mutex_;
};

} // namespace logtap
