#include <catch2/catch_test_macros.hpp>
#include "log_record.hpp"

using namespace logtap;

TEST_CASE("LogRecord decodes the standard fields", "[record]") {
    auto record = LogRecord::parse_line(
        R"({"ts":"2025-03-01T10:00:00+00:00","level":"INFO","component":"mcp-server",)"
        R"("event":"tool_call","data":{"tool":"read_file","args":{"path":"a.txt"}},"pid":321,"host":"box"})",
        "mcp-server.jsonl");

    REQUIRE(record);
    REQUIRE(record->ts() == "2025-03-01T10:00:00+00:00");
    REQUIRE(record->level() == "INFO");
    REQUIRE(record->component() == "mcp-server");
    REQUIRE(record->event() == "tool_call");
    REQUIRE(record->pid() == 321);
    REQUIRE(record->host() == "box");
    REQUIRE(record->data()["args"]["path"] == "a.txt");
    REQUIRE(record->source() == "mcp-server.jsonl");
}

TEST_CASE("LogRecord keeps fields it does not know about", "[record]") {
    auto record = LogRecord::parse_line(R"({"ts":"t","component":"c","request_id":"r-7","latency_ms":12})");
    REQUIRE(record);

    auto wire = nlohmann::json::parse(record->to_wire());
    REQUIRE(wire["request_id"] == "r-7");
    REQUIRE(wire["latency_ms"] == 12);
    REQUIRE_FALSE(wire.contains("source"));
}

TEST_CASE("LogRecord rejects lines that are not one JSON object", "[record]") {
    std::string error;

    REQUIRE_FALSE(LogRecord::parse_line("not json at all", "", &error));
    REQUIRE(error == "invalid JSON");

    REQUIRE_FALSE(LogRecord::parse_line(R"({"ts": "x")"));
    REQUIRE_FALSE(LogRecord::parse_line(R"([1, 2, 3])", "", &error));
    REQUIRE(error.find("array") != std::string::npos);
    REQUIRE_FALSE(LogRecord::parse_line(R"("just a string")"));

    REQUIRE_THROWS_AS(LogRecord::from_json(nlohmann::json::array()), std::invalid_argument);
}

TEST_CASE("LogRecord missing fields read as empty", "[record]") {
    auto record = LogRecord::parse_line(R"({"event":"started"})");
    REQUIRE(record);
    REQUIRE(record->level().empty());
    REQUIRE(record->pid() == 0);
    REQUIRE(record->data().is_object());
    REQUIRE(record->data().empty());
}

TEST_CASE("LogRecord field_text gives scalar values a text form", "[record]") {
    auto record = LogRecord::parse_line(
        R"({"level":"ERROR","pid":17,"ok":true,"ratio":0.5,"data":{"a":1},"tags":["x"],"none":null})");
    REQUIRE(record);

    REQUIRE(record->field_text("level") == std::optional<std::string>("ERROR"));
    REQUIRE(record->field_text("pid") == std::optional<std::string>("17"));
    REQUIRE(record->field_text("ok") == std::optional<std::string>("true"));
    REQUIRE(record->field_text("ratio") == std::optional<std::string>("0.5"));
    REQUIRE_FALSE(record->field_text("data"));
    REQUIRE_FALSE(record->field_text("tags"));
    REQUIRE_FALSE(record->field_text("none"));
    REQUIRE_FALSE(record->field_text("missing"));
}

TEST_CASE("Level strings map to display severities", "[record]") {
    REQUIRE(level_to_severity("ERROR") == Severity::Error);
    REQUIRE(level_to_severity("critical") == Severity::Error);
    REQUIRE(level_to_severity("Warning") == Severity::Warning);
    REQUIRE(level_to_severity("INFO") == Severity::Info);
    REQUIRE(level_to_severity("debug") == Severity::Debug);
    REQUIRE(level_to_severity("verbose-ish") == Severity::Unknown);
    REQUIRE(severity_to_string(Severity::Warning) == "warning");
}
