#include <catch2/catch_test_macros.hpp>

#include "model/json.hpp"
#include "port/port_prober.hpp"
#include "servers/http_health_checker.hpp"
#include "servers/server_registry.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct TmpFile {
    fs::path dir;
    std::string path;

    TmpFile() {
        std::string tmpl = (fs::temp_directory_path() / "tw_test_servers_XXXXXX").string();
        dir = ::mkdtemp(tmpl.data());
        path = (dir / "servers.json").string();
    }

    ~TmpFile() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(const std::string& content) const {
        std::ofstream(path) << content;
    }
};

constexpr const char* kServersJson = R"({
  "servers": {
    "main": {
      "name": "main",
      "path": "/src/app",
      "port": 3592,
      "pid": 1234,
      "status": "running",
      "url": "http://localhost:3592",
      "started_at": "2026-01-02T15:04:05.123456789-07:00",
      "stopped_at": "0001-01-01T00:00:00Z",
      "tags": ["web", "primary"]
    },
    "feature-auth": {
      "path": "/src/app-auth",
      "port": 3846,
      "status": "stopped",
      "url": "http://localhost:3846"
    },
    "orphan": {
      "port": 3001,
      "status": "running"
    }
  }
})";

} // namespace

TEST_CASE("ServerRegistry parse", "[servers]") {
    SECTION("ParsesEntriesSortedByName") {
        auto entries = ServerRegistry::parse(kServersJson);
        REQUIRE(entries.has_value());
        REQUIRE(entries->size() == 2);  // orphan has no path
        REQUIRE((*entries)[0].name == "feature-auth");
        REQUIRE((*entries)[1].name == "main");
    }

    SECTION("Fields") {
        auto entries = ServerRegistry::parse(kServersJson);
        const auto& main = (*entries)[1];
        REQUIRE(main.path == "/src/app");
        REQUIRE(main.info.port == 3592);
        REQUIRE(main.info.pid == 1234);
        REQUIRE(main.info.status == "running");
        REQUIRE(main.info.is_running());
        REQUIRE(main.tags == std::vector<std::string>{"web", "primary"});

        REQUIRE(main.info.started_at.has_value());
        REQUIRE(format_timestamp(*main.info.started_at) == "2026-01-02T22:04:05Z");
        REQUIRE_FALSE(main.info.stopped_at.has_value());

        const auto& auth = (*entries)[0];
        REQUIRE_FALSE(auth.info.is_running());
        REQUIRE_FALSE(auth.info.started_at.has_value());
        REQUIRE(auth.tags.empty());
    }

    SECTION("NoServersKey") {
        auto entries = ServerRegistry::parse("{}");
        REQUIRE(entries.has_value());
        REQUIRE(entries->empty());
    }

    SECTION("Malformed") {
        REQUIRE_FALSE(ServerRegistry::parse("{not json").has_value());
        REQUIRE_FALSE(ServerRegistry::parse("[]").has_value());
        REQUIRE_FALSE(ServerRegistry::parse(R"({"servers": []})").has_value());
    }
}

TEST_CASE("ServerRegistry load", "[servers]") {
    TmpFile tmp;

    SECTION("MissingFile") {
        ServerRegistry reg(tmp.path);
        REQUIRE(reg.load().empty());
    }

    SECTION("CorruptFile") {
        tmp.write("{\"servers\": ");
        ServerRegistry reg(tmp.path);
        REQUIRE(reg.load().empty());
    }

    SECTION("ValidFile") {
        tmp.write(kServersJson);
        ServerRegistry reg(tmp.path);
        REQUIRE(reg.load().size() == 2);
        REQUIRE(reg.path() == tmp.path);
    }
}

TEST_CASE("attach_servers", "[servers]") {
    auto entries = ServerRegistry::parse(kServersJson);
    REQUIRE(entries.has_value());

    std::vector<Worktree> worktrees(3);
    worktrees[0].path = "/src/app";
    worktrees[1].path = "/src/app-auth";
    worktrees[2].path = "/src/unrelated";

    attach_servers(worktrees, *entries);

    SECTION("RunningServer") {
        REQUIRE(worktrees[0].server.has_value());
        REQUIRE(worktrees[0].server->port == 3592);
        REQUIRE(worktrees[0].has_server);
        REQUIRE(worktrees[0].tags == std::vector<std::string>{"web", "primary"});
    }

    SECTION("StoppedServerAttachedButNotRunning") {
        REQUIRE(worktrees[1].server.has_value());
        REQUIRE_FALSE(worktrees[1].has_server);
    }

    SECTION("NoMatch") {
        REQUIRE_FALSE(worktrees[2].server.has_value());
        REQUIRE_FALSE(worktrees[2].has_server);
        REQUIRE(worktrees[2].tags.empty());
    }
}

TEST_CASE("HttpHealthChecker", "[servers]") {
    HttpHealthChecker checker(std::chrono::seconds(1));

    SECTION("NotRunningIsUnknown") {
        ServerInfo server{.port = 3592, .status = "stopped"};
        REQUIRE(checker.check(server) == "unknown");
    }

    SECTION("InvalidPortIsUnhealthy") {
        ServerInfo server{.port = 0, .status = "running"};
        REQUIRE(checker.check(server) == "unhealthy");
    }

    SECTION("NothingListeningIsUnhealthy") {
        auto free_port = port::find_available_port(41000, 41999);
        REQUIRE(free_port.has_value());

        ServerInfo server{.port = *free_port, .status = "starting"};
        REQUIRE(checker.check(server) == "unhealthy");
    }
}
