#include "config.hpp"
#include "console_ui.hpp"
#include "http_server.hpp"
#include "server_log.hpp"
#include "source_registry.hpp"
#include "stream_broadcaster.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

using namespace logtap;

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = parse_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif

    try {
        std::error_code ec;
        std::filesystem::create_directories(config.log_dir, ec);
        if (ec) {
            throw std::runtime_error("Cannot create log directory " + config.log_dir + ": " + ec.message());
        }

        TailerOptions tailer_options;
        tailer_options.poll_interval = config.poll_interval;
        tailer_options.from_start = config.from_start;

        BroadcasterOptions broadcaster_options;
        broadcaster_options.queue_capacity = config.queue_size;
        broadcaster_options.keepalive = config.keepalive;

        SourceRegistry registry(config.log_dir, tailer_options);
        StreamBroadcaster broadcaster(registry, broadcaster_options);
        HttpServer http(registry, broadcaster, config.host, config.port, config.http_threads);

        ServerLog::log("Main", "Log directory: " + config.log_dir + " (" +
            std::to_string(registry.list_files().size()) + " files)");

        http.start();

        if (config.tui) {
            ConsoleUI ui(broadcaster, registry, config);
            ServerLog::set_sink(ui.get_log_sink());
            try {
                ui.run(running);
            } catch (...) {
                ServerLog::reset_sink();
                throw;
            }
            ServerLog::reset_sink();
        } else {
            std::cout << "\nViewer:    http://" << config.host << ":" << config.port << "/" << std::endl;
            std::cout << "Dashboard: http://" << config.host << ":" << config.port << "/dashboard" << std::endl;
            std::cout << "Press Ctrl+C to stop.\n" << std::endl;

            while (running) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }

        ServerLog::log("Main", "Stopping services...");
        broadcaster.stop();
        http.stop();
        registry.stop_all();

        auto stats = broadcaster.stats();
        ServerLog::log("Main", "Shutdown complete. Streams served: " + std::to_string(stats.opened) +
            ", records delivered: " + std::to_string(stats.delivered));

    } catch (const std::exception& e) {
        ServerLog::reset_sink();
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
