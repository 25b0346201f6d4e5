#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <vector>

using namespace logtap;

namespace {

Config parse(std::vector<const char*> args) {
    args.insert(args.begin(), "logtap");
    return parse_args(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("Config defaults", "[config]") {
    auto config = parse({});

    REQUIRE(config.host == "127.0.0.1");
    REQUIRE(config.port == 5050);
    REQUIRE(config.log_dir == "./logs");
    REQUIRE(config.poll_interval == std::chrono::milliseconds(250));
    REQUIRE(config.queue_size == 1000);
    REQUIRE(config.keepalive == std::chrono::seconds(15));
    REQUIRE_FALSE(config.from_start);
    REQUIRE_FALSE(config.tui);
    REQUIRE_FALSE(config.show_help);
}

TEST_CASE("Config parses every option", "[config]") {
    auto config = parse({
        "--host", "0.0.0.0", "--port", "8080", "--log-dir", "/var/log/app",
        "--poll-ms", "50", "--queue-size", "200", "--keepalive-sec", "5",
        "--http-threads", "8", "--from-start",
        "--tui", "--files", "mcp-server.jsonl, mcp-client-a.jsonl,", "--filter", "level=ERROR"
    });

    REQUIRE(config.host == "0.0.0.0");
    REQUIRE(config.port == 8080);
    REQUIRE(config.log_dir == "/var/log/app");
    REQUIRE(config.poll_interval == std::chrono::milliseconds(50));
    REQUIRE(config.queue_size == 200);
    REQUIRE(config.keepalive == std::chrono::seconds(5));
    REQUIRE(config.http_threads == 8);
    REQUIRE(config.from_start);
    REQUIRE(config.tui);
    REQUIRE(config.tui_files == std::vector<std::string>{"mcp-server.jsonl", "mcp-client-a.jsonl"});
    REQUIRE(config.tui_filter == "level=ERROR");
}

TEST_CASE("Config rejects bad arguments", "[config]") {
    REQUIRE_THROWS_AS(parse({"--bogus"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--port"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--port", "http"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--port", "0"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--port", "70000"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--port", "-1"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--poll-ms", "1"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--queue-size", "0"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--log-dir", ""}), ConfigError);

    try {
        parse({"--verbose"});
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        REQUIRE(std::string(e.what()) == "unknown option: --verbose");
    }
}

TEST_CASE("Help flag is recognised", "[config]") {
    REQUIRE(parse({"--help"}).show_help);
    REQUIRE(parse({"-h"}).show_help);
    REQUIRE(usage("logtap").find("--log-dir") != std::string::npos);
}

TEST_CASE("split_list trims and skips empty items", "[config]") {
    REQUIRE(split_list("").empty());
    REQUIRE(split_list(" , ,").empty());
    REQUIRE(split_list("a.jsonl") == std::vector<std::string>{"a.jsonl"});
    REQUIRE(split_list(" a.jsonl ,b.jsonl,,c.jsonl ") ==
            std::vector<std::string>{"a.jsonl", "b.jsonl", "c.jsonl"});
}
