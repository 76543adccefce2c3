#include <catch2/catch_test_macros.hpp>

#include "api/http_server.hpp"
#include "api/snapshot_api.hpp"
#include "snapshot_store.hpp"

#include <arpa/inet.h>
#include <chrono>
#include <httplib.h>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {

Snapshot sample_snapshot() {
    Worktree main_wt;
    main_wt.name = "main";
    main_wt.path = "/src/app";
    main_wt.branch = "main";
    main_wt.main_repo = "/src/app";

    Worktree auth;
    auth.name = "feature-auth";
    auth.path = "/src/app-auth";
    auth.branch = "feature/auth";
    auth.main_repo = "/src/app";
    auth.has_claude = true;
    auth.agent = AgentInfo{.type = "claude", .pid = 4242, .path = "/src/app-auth"};

    AgentRecord rec{.worktree = "feature-auth", .path = "/src/app-auth",
                    .branch = "feature/auth", .type = "claude", .pid = 4242};

    return Snapshot{{auth, main_wt}, {rec}, Clock::now()};
}

// Opens a connection and sends half a request line, then goes quiet.
int stalled_client(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    std::string partial = "GET /api/work";
    ::send(fd, partial.data(), partial.size(), MSG_NOSIGNAL);
    return fd;
}

} // namespace

TEST_CASE("SnapshotApi", "[api]") {
    SnapshotStore store;
    SnapshotApi api(store);

    SECTION("EmptyStoreServesEmptyArrays") {
        auto resp = api.handle("GET", "/api/workspaces");
        REQUIRE(resp.status == 200);
        REQUIRE(json::parse(resp.body) == json::array());
    }

    SECTION("Workspaces") {
        store.publish(sample_snapshot());
        auto resp = api.handle("GET", "/api/workspaces");
        REQUIRE(resp.status == 200);

        auto j = json::parse(resp.body);
        REQUIRE(j.size() == 2);
        REQUIRE(j[0]["name"] == "feature-auth");
        REQUIRE(j[0]["has_claude"] == true);
        REQUIRE(j[0]["main_repo"] == "/src/app");
        REQUIRE_FALSE(j[0].contains("server"));
        REQUIRE_FALSE(j[0].contains("tags"));
    }

    SECTION("Agents") {
        store.publish(sample_snapshot());
        auto resp = api.handle("GET", "/api/agents");
        REQUIRE(resp.status == 200);

        auto j = json::parse(resp.body);
        REQUIRE(j.size() == 1);
        REQUIRE(j[0]["type"] == "claude");
        REQUIRE(j[0]["pid"] == 4242);
        REQUIRE(j[0]["worktree"] == "feature-auth");
    }

    SECTION("Health") {
        auto resp = api.handle("GET", "/api/health");
        REQUIRE(resp.status == 200);

        auto j = json::parse(resp.body);
        REQUIRE(j["status"] == "ok");
        auto ts = j["timestamp"].get<std::string>();
        REQUIRE(ts.size() == 20);
        REQUIRE(ts.back() == 'Z');
    }

    SECTION("MethodNotAllowed") {
        for (const char* method : {"POST", "PUT", "DELETE", "PATCH"}) {
            INFO(method);
            auto resp = api.handle(method, "/api/workspaces");
            REQUIRE(resp.status == 405);
            REQUIRE(json::parse(resp.body)["error"] == "Method not allowed");
        }
    }

    SECTION("NotFound") {
        REQUIRE(api.handle("GET", "/api/servers").status == 404);
        REQUIRE(api.handle("GET", "/").status == 404);
    }

    SECTION("UnencodablePathIs500") {
        Worktree bad;
        bad.name = "bad";
        bad.path = "/src/\xff";
        bad.branch = "main";
        bad.main_repo = "/src/\xff";
        store.publish(Snapshot{{bad}, {}, Clock::now()});

        auto resp = api.handle("GET", "/api/workspaces");
        REQUIRE(resp.status == 500);
        REQUIRE(json::parse(resp.body)["error"] == "Failed to encode response");

        // Other endpoints are unaffected.
        REQUIRE(api.handle("GET", "/api/agents").status == 200);
    }

    SECTION("ReadersKeepTheirSnapshot") {
        store.publish(sample_snapshot());
        auto held = store.current();
        store.publish(Snapshot{});
        REQUIRE(held->worktrees.size() == 2);
        REQUIRE(store.current()->worktrees.empty());
    }
}

TEST_CASE("HttpServer", "[api]") {
    SnapshotStore store;
    store.publish(sample_snapshot());
    SnapshotApi api(store);

    HttpServer server([&api](const std::string& m, const std::string& p) { return api.handle(m, p); });
    REQUIRE(server.start("127.0.0.1", 0));
    REQUIRE(server.is_running());
    REQUIRE(server.port() != 0);

    httplib::Client cli("127.0.0.1", server.port());
    cli.set_connection_timeout(2, 0);
    cli.set_read_timeout(2, 0);

    SECTION("GetWorkspaces") {
        auto res = cli.Get("/api/workspaces");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        REQUIRE(res->get_header_value("Content-Type") == "application/json");
        REQUIRE(res->get_header_value("Access-Control-Allow-Origin") == "*");
        REQUIRE(json::parse(res->body).size() == 2);
    }

    SECTION("QueryStringIgnored") {
        auto res = cli.Get("/api/health?x=1");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        REQUIRE(json::parse(res->body)["status"] == "ok");
    }

    SECTION("UnknownPath") {
        auto res = cli.Get("/api/servers");
        REQUIRE(res);
        REQUIRE(res->status == 404);
        REQUIRE(res->get_header_value("Access-Control-Allow-Origin") == "*");
    }

    SECTION("PostRejected") {
        auto res = cli.Post("/api/agents", "", "application/json");
        REQUIRE(res);
        REQUIRE(res->status == 405);
        REQUIRE(json::parse(res->body)["error"] == "Method not allowed");
    }

    SECTION("DeleteRejected") {
        auto res = cli.Delete("/api/workspaces");
        REQUIRE(res);
        REQUIRE(res->status == 405);
    }

    SECTION("StalledClientDoesNotBlockOthers") {
        int stalled = stalled_client(server.port());
        REQUIRE(stalled >= 0);

        auto started = std::chrono::steady_clock::now();
        auto res = cli.Get("/api/health");
        auto elapsed = std::chrono::steady_clock::now() - started;
        ::close(stalled);

        REQUIRE(res);
        REQUIRE(res->status == 200);
        REQUIRE(elapsed < std::chrono::seconds(1));
    }

    SECTION("StopIsIdempotent") {
        server.stop();
        REQUIRE_FALSE(server.is_running());
        server.stop();
    }

    server.stop();
}
