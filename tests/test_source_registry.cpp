#include <catch2/catch_test_macros.hpp>
#include "source_registry.hpp"
#include "test_helpers.hpp"

using namespace logtap;
using namespace logtap::test;
using namespace std::chrono_literals;

namespace {

TailerOptions fast_polling() {
    TailerOptions options;
    options.poll_interval = 10ms;
    return options;
}

std::shared_ptr<Multiplexer> listener(uint64_t id) {
    return std::make_shared<Multiplexer>(id, RecordFilter(), 100);
}

} // namespace

TEST_CASE("SourceRegistry lists only jsonl files, sorted", "[registry]") {
    TempLogDir dir;
    dir.append("mcp-server.jsonl", "");
    dir.append("mcp-client-b.jsonl", "");
    dir.append("mcp-client-a.jsonl", "");
    dir.append("notes.txt", "");
    dir.append("server.jsonl.bak", "");
    dir.append(".jsonl", "");
    std::filesystem::create_directories(dir.path / "nested.jsonl");

    SourceRegistry registry(dir.path);
    REQUIRE(registry.list_files() == std::vector<std::string>{
        "mcp-client-a.jsonl", "mcp-client-b.jsonl", "mcp-server.jsonl"});
}

TEST_CASE("SourceRegistry lists nothing for a missing directory", "[registry]") {
    TempLogDir dir;
    SourceRegistry registry(dir.path / "does-not-exist");
    REQUIRE(registry.list_files().empty());
}

TEST_CASE("SourceRegistry rejects names outside the log directory", "[registry]") {
    TempLogDir dir;
    dir.append("app.jsonl", "");
    SourceRegistry registry(dir.path);

    REQUIRE(registry.resolve("app.jsonl") == dir.path / "app.jsonl");

    REQUIRE_THROWS_AS(registry.resolve(""), SourceError);
    REQUIRE_THROWS_AS(registry.resolve(".."), SourceError);
    REQUIRE_THROWS_AS(registry.resolve("../app.jsonl"), SourceError);
    REQUIRE_THROWS_AS(registry.resolve("sub/app.jsonl"), SourceError);
    REQUIRE_THROWS_AS(registry.resolve("..\\app.jsonl"), SourceError);
    REQUIRE_THROWS_AS(registry.resolve("/etc/passwd"), SourceError);
    REQUIRE_THROWS_AS(registry.resolve("app.txt"), SourceError);
}

TEST_CASE("SourceRegistry rejects unknown files", "[registry]") {
    TempLogDir dir;
    SourceRegistry registry(dir.path);

    try {
        registry.resolve("ghost.jsonl");
        FAIL("expected SourceError");
    } catch (const SourceError& e) {
        REQUIRE(std::string(e.what()).find("ghost.jsonl") != std::string::npos);
    }
}

TEST_CASE("SourceRegistry shares one tailer per file", "[registry]") {
    TempLogDir dir;
    dir.append("a.jsonl", "");
    dir.append("b.jsonl", "");
    SourceRegistry registry(dir.path, fast_polling());

    auto first = listener(1);
    auto second = listener(2);
    registry.acquire({"a.jsonl", "b.jsonl"}, first);
    registry.acquire({"a.jsonl"}, second);

    REQUIRE(registry.active_count() == 2);
    REQUIRE(registry.references("a.jsonl") == 2);
    REQUIRE(registry.references("b.jsonl") == 1);

    auto sources = registry.list_sources();
    REQUIRE(sources.size() == 2);
    REQUIRE(sources[0].name == "a.jsonl");
    REQUIRE(sources[0].subscribers == 2);
    REQUIRE(sources[0].tailer.listeners == 2);
    REQUIRE(sources[0].tailer.running);

    // One line, one read: both listeners see the same record instance
    dir.append("a.jsonl", record_line("server", "shared"));
    auto r1 = first->next(3s);
    auto r2 = second->next(3s);
    REQUIRE(r1);
    REQUIRE(r2);
    REQUIRE(r1->get() == r2->get());
}

TEST_CASE("SourceRegistry stops a tailer when its last reference goes", "[registry]") {
    TempLogDir dir;
    dir.append("a.jsonl", "");
    dir.append("b.jsonl", "");
    SourceRegistry registry(dir.path, fast_polling());

    registry.acquire({"a.jsonl", "b.jsonl"}, listener(1));
    registry.acquire({"a.jsonl"}, listener(2));

    registry.release({"a.jsonl", "b.jsonl"}, 1);
    REQUIRE(registry.active_count() == 1);
    REQUIRE(registry.references("a.jsonl") == 1);
    REQUIRE(registry.references("b.jsonl") == 0);

    registry.release({"a.jsonl"}, 2);
    REQUIRE(registry.active_count() == 0);
    REQUIRE(registry.list_sources().empty());

    // Releasing again is harmless
    registry.release({"a.jsonl"}, 2);
    REQUIRE(registry.active_count() == 0);
}

TEST_CASE("SourceRegistry stop_all stops every tailer", "[registry]") {
    TempLogDir dir;
    dir.append("a.jsonl", "");
    SourceRegistry registry(dir.path, fast_polling());

    registry.acquire({"a.jsonl"}, listener(1));
    registry.stop_all();
    REQUIRE(registry.active_count() == 0);
}

TEST_CASE("SourceRegistry acquire is all or nothing", "[registry]") {
    TempLogDir dir;
    dir.append("a.jsonl", "");
    dir.append("b.jsonl", "");
    // Passes the name check but cannot be tailed
    std::filesystem::create_directories(dir.path / "dir.jsonl");
    SourceRegistry registry(dir.path, fast_polling());

    auto existing = listener(1);
    registry.acquire({"a.jsonl"}, existing);

    auto failing = listener(2);
    REQUIRE_THROWS_AS(registry.acquire({"a.jsonl", "b.jsonl", "dir.jsonl"}, failing), std::runtime_error);

    REQUIRE(registry.active_count() == 1);
    REQUIRE(registry.references("a.jsonl") == 1);
    REQUIRE(registry.references("b.jsonl") == 0);
    REQUIRE(registry.references("dir.jsonl") == 0);

    auto sources = registry.list_sources();
    REQUIRE(sources.size() == 1);
    REQUIRE(sources[0].tailer.listeners == 1);

    // The surviving listener still receives records, the failed one does not
    dir.append("a.jsonl", record_line("server", "after"));
    auto record = existing->next(3s);
    REQUIRE(record);
    REQUIRE((*record)->event() == "after");
    REQUIRE_FALSE(failing->next(100ms));
}
