#include <catch2/catch_test_macros.hpp>

#include "hub/hub.hpp"
#include "hub/hub_session.hpp"
#include "platform/linux/socket_connection.hpp"

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <thread>

using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

// Reads lines from the peer until one has the wanted type.
bool read_until_type(SocketConnection& peer, const std::string& type, json& out) {
    auto deadline = std::chrono::steady_clock::now() + 2s;
    std::string line;
    while (std::chrono::steady_clock::now() < deadline) {
        auto status = peer.read_line(line, 100ms);
        if (status == Connection::ReadStatus::Timeout) continue;
        if (status != Connection::ReadStatus::Line) return false;
        out = json::parse(line);
        if (out["type"] == type) return true;
    }
    return false;
}

} // namespace

TEST_CASE("Hub", "[hub]") {
    Hub hub;
    hub.start();

    SECTION("BroadcastSkipsFullClient") {
        auto a = std::make_shared<HubClient>(4);
        auto b = std::make_shared<HubClient>(4);
        auto full = std::make_shared<HubClient>(1);

        auto stale = std::make_shared<const Message>(Ping{});
        REQUIRE(full->offer(stale));

        hub.register_client(a);
        hub.register_client(b);
        hub.register_client(full);

        hub.broadcast(WorkspacesUpdated{});
        hub.sync();

        REQUIRE(hub.client_count() == 3);
        REQUIRE(a->outbox().size() == 1);
        REQUIRE(b->outbox().size() == 1);
        REQUIRE(full->outbox().size() == 1);

        auto got = full->outbox().try_pop();
        REQUIRE(got.has_value());
        REQUIRE(*got == stale);

        auto delivered = a->outbox().try_pop();
        REQUIRE(delivered.has_value());
        REQUIRE(std::holds_alternative<WorkspacesUpdated>(**delivered));
    }

    SECTION("SharedPayload") {
        auto a = std::make_shared<HubClient>();
        auto b = std::make_shared<HubClient>();
        hub.register_client(a);
        hub.register_client(b);
        hub.broadcast(AgentsUpdated{});
        hub.sync();

        auto ma = a->outbox().try_pop();
        auto mb = b->outbox().try_pop();
        REQUIRE(ma.has_value());
        REQUIRE(mb.has_value());
        REQUIRE(ma->get() == mb->get());
    }

    SECTION("UnregisterClosesQueue") {
        auto a = std::make_shared<HubClient>();
        hub.register_client(a);
        hub.sync();
        REQUIRE(hub.client_count() == 1);

        hub.unregister_client(a);
        hub.broadcast(Ping{});
        hub.sync();

        REQUIRE(hub.client_count() == 0);
        REQUIRE(a->outbox().closed());
        REQUIRE(a->outbox().size() == 0);
    }

    SECTION("UnregisterUnknownIsNoop") {
        auto a = std::make_shared<HubClient>();
        hub.register_client(a);
        hub.unregister_client(std::make_shared<HubClient>());
        hub.sync();

        REQUIRE(hub.client_count() == 1);
        REQUIRE_FALSE(a->outbox().closed());
    }

    SECTION("StopClosesEveryQueue") {
        auto a = std::make_shared<HubClient>();
        auto b = std::make_shared<HubClient>();
        hub.register_client(a);
        hub.register_client(b);
        hub.sync();

        hub.stop();
        REQUIRE(a->outbox().closed());
        REQUIRE(b->outbox().closed());
        REQUIRE(hub.client_count() == 0);

        auto late = std::make_shared<HubClient>();
        hub.register_client(late);
        REQUIRE(late->outbox().closed());
    }

    SECTION("ClientIdsAreUnique") {
        HubClient a;
        HubClient b;
        REQUIRE(a.id() != b.id());
    }
}

TEST_CASE("Hub stop right after start", "[hub]") {
    for (int i = 0; i < 200; ++i) {
        Hub hub;
        hub.start();
        auto client = std::make_shared<HubClient>();
        hub.register_client(client);
        hub.stop();

        REQUIRE(client->outbox().closed());
        REQUIRE(hub.client_count() == 0);
    }
}

TEST_CASE("HubSession", "[hub]") {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0);

    Hub hub;
    hub.start();

    auto client = std::make_shared<HubClient>(8);
    SocketConnection peer(fds[1]);

    SECTION("SubscribeRecordsTopics") {
        HubSession session(hub, std::make_unique<SocketConnection>(fds[0]), client, 10s);
        session.start();

        REQUIRE(peer.write_line(R"({"type":"subscribe","payload":["workspaces","agents"]})"));
        REQUIRE(eventually([&] { return client->subscribed("agents"); }));
        REQUIRE(client->subscribed("workspaces"));
        REQUIRE_FALSE(client->subscribed("servers"));
    }

    SECTION("BroadcastReachesPeer") {
        HubSession session(hub, std::make_unique<SocketConnection>(fds[0]), client, 10s);
        session.start();
        hub.sync();
        REQUIRE(hub.client_count() == 1);

        Worktree wt;
        wt.name = "main";
        wt.path = "/src/app";
        wt.branch = "main";
        hub.broadcast(WorkspacesUpdated{{wt}});

        json msg;
        REQUIRE(read_until_type(peer, "workspaces_updated", msg));
        REQUIRE(msg["payload"][0]["name"] == "main");
    }

    SECTION("UnencodableMessageIsSkipped") {
        HubSession session(hub, std::make_unique<SocketConnection>(fds[0]), client, 10s);
        session.start();
        hub.sync();

        Worktree bad;
        bad.name = "bad";
        bad.path = "/src/\xff";
        bad.branch = "main";
        hub.broadcast(WorkspacesUpdated{{bad}});
        hub.broadcast(AgentsUpdated{});

        std::string line;
        Connection::ReadStatus status = Connection::ReadStatus::Timeout;
        for (int i = 0; i < 20 && status == Connection::ReadStatus::Timeout; ++i) {
            status = peer.read_line(line, 100ms);
        }
        REQUIRE(status == Connection::ReadStatus::Line);
        REQUIRE(json::parse(line)["type"] == "agents_updated");
        REQUIRE_FALSE(session.finished());
    }

    SECTION("InboundTrafficCountsAsActivity") {
        HubSession session(hub, std::make_unique<SocketConnection>(fds[0]), client, 10s);
        session.start();

        auto before = client->last_seen();
        std::this_thread::sleep_for(20ms);
        REQUIRE(peer.write_line(R"({"type":"subscribe","payload":["agents"]})"));
        REQUIRE(eventually([&] { return client->subscribed("agents"); }));
        REQUIRE(client->last_seen() > before);
    }

    SECTION("KeepalivePing") {
        HubSession session(hub, std::make_unique<SocketConnection>(fds[0]), client, 100ms);
        session.start();

        json msg;
        REQUIRE(read_until_type(peer, "ping", msg));
        REQUIRE_FALSE(msg.contains("payload"));
    }

    SECTION("UnknownTypeIsIgnored") {
        HubSession session(hub, std::make_unique<SocketConnection>(fds[0]), client, 10s);
        session.start();

        REQUIRE(peer.write_line(R"({"type":"hello"})"));
        REQUIRE(peer.write_line(R"({"type":"subscribe","payload":["agents"]})"));
        REQUIRE(eventually([&] { return client->subscribed("agents"); }));
        REQUIRE_FALSE(session.finished());
    }

    SECTION("MalformedEndsSession") {
        HubSession session(hub, std::make_unique<SocketConnection>(fds[0]), client, 10s);
        session.start();
        hub.sync();
        REQUIRE(hub.client_count() == 1);

        REQUIRE(peer.write_line("this is not json"));
        REQUIRE(eventually([&] { return session.finished(); }));

        hub.sync();
        REQUIRE(hub.client_count() == 0);
        REQUIRE(client->outbox().closed());
    }

    SECTION("PeerHangupEndsSession") {
        HubSession session(hub, std::make_unique<SocketConnection>(fds[0]), client, 10s);
        session.start();

        peer.shutdown();
        REQUIRE(eventually([&] { return session.finished(); }));
        hub.sync();
        REQUIRE(hub.client_count() == 0);
    }
}
