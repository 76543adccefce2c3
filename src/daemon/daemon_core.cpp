#include "daemon_core.hpp"

#include "discovery/worktree_discovery.hpp"
#include "model/snapshot.hpp"
#include "platform/linux/socket_connection.hpp"
#include "platform/linux/websocket_connection.hpp"
#include "servers/server_registry.hpp"

#include <format>
#include <print>
#include <set>

DaemonCore::DaemonCore(Config config, bool verbose,
                       const ProcessInspector& inspector, HealthChecker& health,
                       Hub& hub, SnapshotStore& store, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      inspector_(inspector), health_(health),
      hub_(hub), store_(store),
      notify_(std::move(notify)),
      probe_(inspector_, ActivityOptions{
          .agents = config_.agents,
          .editor_process = config_.editor.process,
          .editor_marker_dir = config_.editor.marker_dir,
      }) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init() {
    auto db_path = config_.snapshot_db_path();
    if (db_path.empty()) db_path = "/tmp/treewatch/snapshot.db";

    if (!db_.open(db_path)) {
        std::println(stderr, "Warning: snapshot DB failed to open, persistence disabled");
    } else if (auto previous = db_.load()) {
        // Serve the last known state until the first pass lands
        log(std::format("Restored {} worktree(s) from {}", previous->worktrees.size(), db_path));
        store_.publish(std::move(*previous));
    }

    return true;
}

void DaemonCore::request_refresh() {
    if (refresh_in_flight_) {
        refresh_pending_ = true;
        return;
    }
    start_worker();
}

void DaemonCore::start_worker() {
    refresh_in_flight_ = true;
    worker_result_ = {};

    worker_ = std::jthread([this](std::stop_token) {
        worker_result_ = build_snapshot();
        notify_();
    });
}

void DaemonCore::on_refresh_complete() {
    if (!refresh_in_flight_) return;

    if (worker_.joinable()) {
        worker_.join();
    }
    refresh_in_flight_ = false;

    publish(std::move(worker_result_));

    if (refresh_pending_) {
        refresh_pending_ = false;
        start_worker();
    }
}

Snapshot DaemonCore::build_snapshot() const {
    WorktreeDiscovery discovery(&probe_, verbose_);

    std::vector<Worktree> worktrees;
    std::set<std::string> seen;
    for (const auto& root : config_.scan_roots()) {
        for (auto& wt : discovery.find_all(root, config_.scan.max_depth)) {
            if (seen.insert(wt.path).second) {
                worktrees.push_back(std::move(wt));
            }
        }
    }

    auto servers_path = config_.servers_path();
    if (!servers_path.empty()) {
        ServerRegistry registry(servers_path, verbose_);
        attach_servers(worktrees, registry.load());
    }

    for (auto& wt : worktrees) {
        if (wt.server) wt.server->health = health_.check(*wt.server);
    }

    return make_snapshot(std::move(worktrees), Clock::now());
}

void DaemonCore::publish(Snapshot snapshot) {
    log(std::format("Snapshot: {} worktree(s), {} agent(s), {} subscriber(s)",
                    snapshot.worktrees.size(), snapshot.agents.size(), hub_.client_count()));

    if (db_.is_open() && !db_.replace(snapshot)) {
        std::println(stderr, "db: failed to persist snapshot");
    }

    hub_.broadcast(WorkspacesUpdated{snapshot.worktrees});
    hub_.broadcast(AgentsUpdated{snapshot.agents});

    store_.publish(std::move(snapshot));
}

void DaemonCore::on_hub_client(int fd) {
    attach_session(std::make_unique<SocketConnection>(fd));
}

void DaemonCore::on_ws_client(int fd) {
    attach_session(std::make_unique<WebSocketConnection>(fd));
}

void DaemonCore::attach_session(std::unique_ptr<Connection> conn) {
    auto client = std::make_shared<HubClient>(config_.hub.queue_capacity);
    auto session = std::make_unique<HubSession>(
        hub_, std::move(conn), client,
        std::chrono::seconds(config_.hub.keepalive_seconds), verbose_);
    session->start();

    // New subscribers get the current state without waiting for the next pass
    auto snap = store_.current();
    client->offer(std::make_shared<const Message>(WorkspacesUpdated{snap->worktrees}));
    client->offer(std::make_shared<const Message>(AgentsUpdated{snap->agents}));

    sessions_.push_back(std::move(session));
    reap_sessions();
}

void DaemonCore::reap_sessions() {
    std::erase_if(sessions_, [](const auto& s) { return s->finished(); });
}

void DaemonCore::shutdown() {
    if (worker_.joinable()) {
        worker_.join();
    }
    refresh_in_flight_ = false;
    refresh_pending_ = false;

    sessions_.clear();
    db_.close();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[treewatch] {}", msg);
    }
}
