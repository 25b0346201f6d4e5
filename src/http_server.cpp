#include "http_server.hpp"
#include "config.hpp"
#include "server_log.hpp"
#include "web_pages.hpp"
#include <algorithm>
#include <sstream>

namespace logtap {

std::vector<DashboardPanel> default_dashboard_panels() {
    return {
        {"all", "All logs (merged)", "", ""},
        {"server", "Server logs (mcp-server)", "mcp-server", "component=mcp-server"},
        {"clients", "Client logs", "mcp-client", ""},
    };
}

std::vector<std::string> select_panel_files(const DashboardPanel& panel,
                                            const std::vector<std::string>& available) {
    std::vector<std::string> files;
    for (const auto& name : available) {
        if (panel.file_match.empty() || name.find(panel.file_match) != std::string::npos) {
            files.push_back(name);
        }
    }
    return files;
}

HttpServer::HttpServer(SourceRegistry& registry, StreamBroadcaster& broadcaster,
                       std::string host, uint16_t port, size_t threads)
    : registry_(registry)
    , broadcaster_(broadcaster)
    , server_(std::make_unique<httplib::Server>())
    , host_(std::move(host))
    , port_(port)
    , threads_(threads)
    , panels_(default_dashboard_panels())
{
    // Every open stream holds a worker for its lifetime
    size_t pool = threads_;
    server_->new_task_queue = [pool] { return new httplib::ThreadPool(pool); };
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::json_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    nlohmann::json error;
    error["error"] = message;
    res.set_content(error.dump(), "application/json");
}

void HttpServer::open_stream(httplib::Response& res, const std::vector<std::string>& files,
                             const std::string& filter) {
    std::shared_ptr<Subscription> subscription;
    try {
        subscription = broadcaster_.subscribe(files, filter);
    } catch (const FilterError& e) {
        json_error(res, 400, std::string("invalid filter: ") + e.what());
        return;
    } catch (const SourceError& e) {
        json_error(res, 404, e.what());
        return;
    } catch (const std::exception& e) {
        json_error(res, 503, e.what());
        return;
    }

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, subscription](size_t, httplib::DataSink& sink) -> bool {
            broadcaster_.serve(
                subscription,
                [&sink](const std::string& chunk) {
                    return sink.write(chunk.data(), chunk.size());
                },
                [&sink]() {
                    return sink.is_writable();
                });
            return false;
        },
        // Runs even if the client went away before the provider started
        [subscription](bool) {
            subscription->close();
        });
}

void HttpServer::setup_routes() {
    server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        std::stringstream msg;
        msg << res.status << " " << req.method << " " << req.path;
        if (!req.params.empty()) {
            msg << "?";
            bool first = true;
            for (const auto& param : req.params) {
                if (!first) msg << "&";
                msg << param.first << "=" << param.second;
                first = false;
            }
        }
        msg << " from " << req.remote_addr;
        ServerLog::log("HTTP", msg.str());
    });

    server_->set_default_headers({{"Access-Control-Allow-Origin", "*"}});

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
    });

    server_->Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(kIndexHtml, "text/html; charset=utf-8");
    });

    server_->Get("/dashboard", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(kDashboardHtml, "text/html; charset=utf-8");
    });

    // Discovery
    server_->Get("/files", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json files = registry_.list_files();
        res.set_content(files.dump(), "application/json");
    });

    server_->Get("/sources", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json sources = nlohmann::json::array();
        for (const auto& info : registry_.list_sources()) {
            sources.push_back(info.to_json());
        }
        nlohmann::json body;
        body["sources"] = sources;
        body["streams"] = broadcaster_.stats().to_json();
        res.set_content(body.dump(), "application/json");
    });

    server_->Get("/stream", [this](const httplib::Request& req, httplib::Response& res) {
        std::vector<std::string> files;
        if (req.has_param("files")) {
            files = split_list(req.get_param_value("files"));
        }
        open_stream(res, files, req.get_param_value("filter"));
    });

    server_->Get("/dashboard/panels", [this](const httplib::Request&, httplib::Response& res) {
        auto available = registry_.list_files();
        nlohmann::json panels = nlohmann::json::array();
        for (const auto& panel : panels_) {
            auto j = panel.to_json();
            j["files"] = select_panel_files(panel, available);
            panels.push_back(j);
        }
        res.set_content(panels.dump(), "application/json");
    });

    server_->Get(R"(/dashboard/stream/([A-Za-z0-9_-]+))", [this](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        auto it = std::find_if(panels_.begin(), panels_.end(),
            [&id](const DashboardPanel& p) { return p.id == id; });
        if (it == panels_.end()) {
            json_error(res, 404, "unknown dashboard panel '" + id + "'");
            return;
        }

        auto files = select_panel_files(*it, registry_.list_files());
        if (files.empty()) {
            json_error(res, 404, "no log files for panel '" + id + "'");
            return;
        }

        std::string filter = req.has_param("filter") ? req.get_param_value("filter") : it->filter;
        open_stream(res, files, filter);
    });
}

void HttpServer::start() {
    if (running_) return;

    if (port_ == 0) {
        int bound = server_->bind_to_any_port(host_.c_str());
        if (bound <= 0) {
            throw std::runtime_error("Failed to bind " + host_ + " to any port");
        }
        port_ = static_cast<uint16_t>(bound);
    } else if (!server_->bind_to_port(host_.c_str(), port_)) {
        throw std::runtime_error("Failed to bind " + host_ + ":" + std::to_string(port_));
    }
    running_ = true;

    thread_ = std::thread([this]() {
        ServerLog::log("HTTP", "Server listening on " + host_ + ":" + std::to_string(port_));
        server_->listen_after_bind();
    });
}

void HttpServer::stop() {
    if (!running_) return;
    running_ = false;
    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace logtap
