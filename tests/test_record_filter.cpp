#include <catch2/catch_test_macros.hpp>
#include "record_filter.hpp"
#include <vector>

using namespace logtap;

namespace {

LogRecord make(const std::string& json) {
    auto record = LogRecord::parse_line(json);
    REQUIRE(record);
    return *record;
}

} // namespace

TEST_CASE("Empty filter matches every record", "[filter]") {
    for (const std::string expr : {"", "   ", ",", " , ,"}) {
        auto filter = RecordFilter::compile(expr);
        REQUIRE(filter.empty());
        REQUIRE(filter.matches(make(R"({"level":"INFO"})")));
        REQUIRE(filter.matches(make(R"({})")));
    }
}

TEST_CASE("Filter compiles key=value pairs in order", "[filter]") {
    auto filter = RecordFilter::compile(" level = ERROR , component=mcp-server,");

    REQUIRE(filter.constraints().size() == 2);
    REQUIRE(filter.constraints()[0].field == "level");
    REQUIRE(filter.constraints()[0].expected == "ERROR");
    REQUIRE(filter.constraints()[1].field == "component");
    REQUIRE(filter.constraints()[1].expected == "mcp-server");
    REQUIRE(filter.to_string() == "level=ERROR,component=mcp-server");
}

TEST_CASE("Filter constraints are ANDed", "[filter]") {
    auto filter = RecordFilter::compile("level=ERROR,component=mcp-server");

    REQUIRE(filter.matches(make(R"({"level":"ERROR","component":"mcp-server"})")));
    REQUIRE_FALSE(filter.matches(make(R"({"level":"INFO","component":"mcp-server"})")));
    REQUIRE_FALSE(filter.matches(make(R"({"level":"ERROR","component":"mcp-client"})")));
    REQUIRE_FALSE(filter.matches(make(R"({"level":"ERROR"})")));
}

TEST_CASE("Filter by component keeps exactly the matching records", "[filter]") {
    std::vector<LogRecord> records = {
        make(R"({"component":"server","event":"a"})"),
        make(R"({"component":"client-a","event":"b"})"),
        make(R"({"component":"server","event":"c"})"),
        make(R"({"component":"client-a","event":"d"})"),
        make(R"({"component":"server","event":"e"})"),
    };

    auto filter = RecordFilter::compile("component=server");
    std::vector<std::string> events;
    for (const auto& r : records) {
        if (filter.matches(r)) events.push_back(r.event());
    }
    REQUIRE(events == std::vector<std::string>{"a", "c", "e"});
}

TEST_CASE("Filter comparison is exact and case-sensitive", "[filter]") {
    auto filter = RecordFilter::compile("level=ERROR");

    REQUIRE_FALSE(filter.matches(make(R"({"level":"error"})")));
    REQUIRE_FALSE(filter.matches(make(R"({"level":"ERRORS"})")));
    REQUIRE_FALSE(filter.matches(make(R"({"level":"ERR*"})")));
    REQUIRE(RecordFilter::compile("level=ERR*").matches(make(R"({"level":"ERR*"})")));
}

TEST_CASE("Filter matches numbers and booleans by their text", "[filter]") {
    REQUIRE(RecordFilter::compile("pid=4242").matches(make(R"({"pid":4242})")));
    REQUIRE_FALSE(RecordFilter::compile("pid=42").matches(make(R"({"pid":4242})")));
    REQUIRE(RecordFilter::compile("cached=true").matches(make(R"({"cached":true})")));
}

TEST_CASE("Filter does not look inside data", "[filter]") {
    auto record = make(R"({"event":"tool_call","data":{"tool":"read_file"}})");

    REQUIRE_FALSE(RecordFilter::compile("tool=read_file").matches(record));
    REQUIRE_FALSE(RecordFilter::compile("data=read_file").matches(record));
}

TEST_CASE("Filter values may be empty or contain '='", "[filter]") {
    auto filter = RecordFilter::compile("query=a=b,note=");

    REQUIRE(filter.constraints()[0].expected == "a=b");
    REQUIRE(filter.constraints()[1].expected.empty());
    REQUIRE(filter.matches(make(R"({"query":"a=b","note":""})")));
}

TEST_CASE("Malformed filter expressions are rejected", "[filter]") {
    REQUIRE_THROWS_AS(RecordFilter::compile("level"), FilterError);
    REQUIRE_THROWS_AS(RecordFilter::compile("level=ERROR,component"), FilterError);
    REQUIRE_THROWS_AS(RecordFilter::compile("=ERROR"), FilterError);
    REQUIRE_THROWS_AS(RecordFilter::compile("  =x"), FilterError);

    try {
        RecordFilter::compile("level=INFO,oops");
        FAIL("expected FilterError");
    } catch (const FilterError& e) {
        REQUIRE(std::string(e.what()).find("oops") != std::string::npos);
    }
}

TEST_CASE("Filter accepts the JSON object form", "[filter]") {
    auto filter = RecordFilter::compile(R"({"level":"ERROR","pid":7})");

    REQUIRE(filter.constraints().size() == 2);
    REQUIRE(filter.matches(make(R"({"level":"ERROR","pid":7})")));
    REQUIRE_FALSE(filter.matches(make(R"({"level":"ERROR","pid":8})")));

    REQUIRE(RecordFilter::compile("{}").empty());
    REQUIRE_THROWS_AS(RecordFilter::compile(R"({"level":)"), FilterError);
    REQUIRE_THROWS_AS(RecordFilter::compile(R"({"data":{"a":1}})"), FilterError);
    REQUIRE_THROWS_AS(RecordFilter::compile(R"({"":"x"})"), FilterError);
}

TEST_CASE("Filter on source matches the file a record came from", "[filter]") {
    auto record = LogRecord::parse_line(R"({"event":"x","component":"mcp-server"})", "mcp-server.jsonl");
    REQUIRE(record);

    REQUIRE(RecordFilter::compile("source=mcp-server.jsonl").matches(*record));
    REQUIRE_FALSE(RecordFilter::compile("source=mcp-client-a.jsonl").matches(*record));
    REQUIRE_FALSE(RecordFilter::compile("source=mcp-server.jsonl").matches(make(R"({"event":"x"})")));

    // A payload field of the same name wins over the file name
    auto tagged = LogRecord::parse_line(R"({"source":"agent"})", "mcp-server.jsonl");
    REQUIRE(tagged);
    REQUIRE(RecordFilter::compile("source=agent").matches(*tagged));
    REQUIRE_FALSE(RecordFilter::compile("source=mcp-server.jsonl").matches(*tagged));
}

TEST_CASE("Filter pair values are trimmed, JSON values are not", "[filter]") {
    auto padded = make(R"({"component":" x "})");
    auto plain = make(R"({"component":"x"})");

    auto pairs = RecordFilter::compile("component= x ");
    REQUIRE(pairs.constraints()[0].expected == "x");
    REQUIRE(pairs.matches(plain));
    REQUIRE_FALSE(pairs.matches(padded));

    auto json = RecordFilter::compile(R"({"component":" x "})");
    REQUIRE(json.matches(padded));
    REQUIRE_FALSE(json.matches(plain));
}
