#pragma once

#include "source_registry.hpp"
#include "stream_broadcaster.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace logtap {

// One pre-configured dashboard stream.
struct DashboardPanel {
    std::string id;
    std::string title;
    std::string file_match;     // substring of the file name; empty selects every file
    std::string filter;         // default filter expression

    nlohmann::json to_json() const {
        return {
            {"id", id},
            {"title", title},
            {"file_match", file_match},
            {"filter", filter}
        };
    }
};

std::vector<DashboardPanel> default_dashboard_panels();

// Files of `available` a panel reads. Empty when nothing matches.
std::vector<std::string> select_panel_files(const DashboardPanel& panel,
                                            const std::vector<std::string>& available);

class HttpServer {
public:
    HttpServer(SourceRegistry& registry, StreamBroadcaster& broadcaster,
               std::string host = "127.0.0.1", uint16_t port = 5050, size_t threads = 32);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts serving on a background thread. Port 0 binds any
    // free port (see port()). Throws std::runtime_error if binding fails.
    void start();
    void stop();
    bool is_running() const { return running_; }

    uint16_t port() const { return port_; }
    const std::vector<DashboardPanel>& panels() const { return panels_; }

private:
    void setup_routes();
    void open_stream(httplib::Response& res, const std::vector<std::string>& files,
                     const std::string& filter);
    static void json_error(httplib::Response& res, int status, const std::string& message);

    SourceRegistry& registry_;
    StreamBroadcaster& broadcaster_;
    std::unique_ptr<httplib::Server> server_;
    std::string host_;
    uint16_t port_;
    size_t threads_;
    std::vector<DashboardPanel> panels_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace logtap
